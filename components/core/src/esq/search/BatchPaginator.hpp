#ifndef ESQ_SEARCH_BATCHPAGINATOR_HPP
#define ESQ_SEARCH_BATCHPAGINATOR_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../DateParser.hpp"
#include "../Defs.hpp"
#include "../ErrorCategory.hpp"
#include "../ExtractionPlan.hpp"
#include "Defs.hpp"
#include "OutputHandler.hpp"
#include "SearchClient.hpp"
#include "SnapshotManager.hpp"

namespace esq::search {
struct PaginatorOptions {
    uint32_t batch_size{cBatchSize};
    std::chrono::milliseconds poll_interval{cPollInterval};
    // Consecutive transient failures tolerated while polling
    uint32_t max_retries{0};
};

/**
 * Position of the paginator between two batches.
 */
struct PaginationState {
    std::optional<PaginationCursor> cursor;
    // std::nullopt means unbounded
    std::optional<uint32_t> remaining_budget;
};

struct BatchResult {
    PaginationState next_state;
    size_t num_hits{0};
    bool is_exhausted{false};
};

/**
 * Reads the plan's documents forward from a cursor in batches and hands each document's
 * `_source` to an output handler.
 */
class BatchPaginator {
public:
    // Constructors
    /**
     * @param client
     * @param plan
     * @param snapshot_manager Manager of the plan's point-in-time, or nullptr if the plan doesn't
     * use one
     * @param output_handler
     * @param options
     */
    BatchPaginator(
            SearchClient& client,
            ExtractionPlan const& plan,
            SnapshotManager* snapshot_manager,
            OutputHandler& output_handler,
            PaginatorOptions const& options
    );

    // Methods
    /**
     * @param cursor Cursor found by the anchor probe, if any
     * @return The state before the first batch
     */
    [[nodiscard]] auto initial_state(std::optional<PaginationCursor> cursor) const
            -> PaginationState;

    /**
     * @param state
     * @param now Reference point for relative times in the plan's range
     * @return A result containing the request body of the next batch on success, or an error
     * code indicating the failure:
     * - ErrorCodeEnum::DateParseFailure if a bound of the plan's range can't be parsed.
     */
    [[nodiscard]] auto build_request(PaginationState const& state, Timestamp now) const
            -> Result<nlohmann::json>;

    /**
     * Fetches and writes a single batch.
     * @param state
     * @param now
     * @return A result containing the outcome of the batch on success, or an error code
     * indicating the failure:
     * - Forwards `build_request`'s return values on failure.
     * - Forwards SearchClient::search's return values on failure.
     * - ErrorCodeEnum::ResponseParseFailure if the response has no hits or a hit has no sort
     *   values.
     * - ErrorCodeEnum::OutputFailure if the output couldn't be flushed.
     */
    [[nodiscard]] auto step(PaginationState const& state, Timestamp now) -> Result<BatchResult>;

    /**
     * Runs batches until the budget is spent or the data is exhausted. When polling, runs until
     * interrupted, replacing the point-in-time and sleeping between batches.
     * @param state
     * @return A void result on success, or an error code indicating the failure:
     * - ErrorCodeEnum::Interrupted if an interrupt was received.
     * - Forwards `step`'s return values on failure, once retries are exhausted.
     * - Forwards SnapshotManager::refresh's return values on failure, once retries are exhausted.
     */
    [[nodiscard]] auto run(PaginationState state) -> Result<void>;

private:
    // Methods
    /**
     * @param error
     * @param num_failures Consecutive failures so far, including this one
     * @return Whether the failure should be retried
     */
    [[nodiscard]] auto should_retry(std::error_code const& error, uint32_t num_failures) const
            -> bool;

    SearchClient& m_client;
    ExtractionPlan const& m_plan;
    SnapshotManager* m_snapshot_manager;
    OutputHandler& m_output_handler;
    PaginatorOptions m_options;
};
}  // namespace esq::search

#endif  // ESQ_SEARCH_BATCHPAGINATOR_HPP
