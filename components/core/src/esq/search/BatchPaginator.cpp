#include "BatchPaginator.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <utility>

#include <boost/outcome/success_failure.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../Defs.hpp"
#include "../ErrorCategory.hpp"
#include "../ErrorCode.hpp"
#include "../Interrupt.hpp"
#include "SearchQueryBuilder.hpp"

namespace esq::search {
namespace {
auto get_current_time() -> Timestamp {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now()
    );
}

/**
 * @param hit
 * @return The hit's `_source`, or null if the service didn't return one
 */
auto get_document(nlohmann::json const& hit) -> nlohmann::json {
    if (hit.is_object() && hit.contains("_source")) {
        return hit.at("_source");
    }
    return nullptr;
}
}  // namespace

BatchPaginator::BatchPaginator(
        SearchClient& client,
        ExtractionPlan const& plan,
        SnapshotManager* snapshot_manager,
        OutputHandler& output_handler,
        PaginatorOptions const& options
)
        : m_client{client},
          m_plan{plan},
          m_snapshot_manager{snapshot_manager},
          m_output_handler{output_handler},
          m_options{options} {}

auto BatchPaginator::initial_state(std::optional<PaginationCursor> cursor) const
        -> PaginationState {
    return {std::move(cursor), m_plan.document_budget};
}

auto BatchPaginator::build_request(PaginationState const& state, Timestamp now) const
        -> Result<nlohmann::json> {
    auto size = m_options.batch_size;
    if (state.remaining_budget.has_value()) {
        size = std::min(size, state.remaining_budget.value());
    }

    std::optional<SnapshotSession> snapshot;
    if (nullptr != m_snapshot_manager) {
        snapshot = m_snapshot_manager->get_session();
    }

    auto const builder = SearchQueryBuilder{}
                                 .with_sort_order(m_plan.sort_order)
                                 .with_size(size)
                                 .with_source_fields(m_plan.select_fields)
                                 .with_query_match(m_plan.match_clause)
                                 .with_search_after(state.cursor)
                                 .with_snapshot(std::move(snapshot))
                                 .with_time_range(
                                         m_plan.time_range.from,
                                         m_plan.time_range.to,
                                         cIngestionLatency,
                                         now
                                 );
    if (builder.has_error()) {
        return builder.error();
    }
    return boost::outcome_v2::success(builder.value().build());
}

auto BatchPaginator::step(PaginationState const& state, Timestamp now) -> Result<BatchResult> {
    BatchResult batch{state, 0, false};
    if (state.remaining_budget.has_value() && 0 == state.remaining_budget.value()) {
        batch.is_exhausted = true;
        return batch;
    }

    auto const request = build_request(state, now);
    if (request.has_error()) {
        return request.error();
    }
    auto const response = m_client.search(request.value());
    if (response.has_error()) {
        return response.error();
    }
    auto const hits_result = extract_hits(response.value());
    if (hits_result.has_error()) {
        return hits_result.error();
    }
    auto const& hits = hits_result.value();

    if (hits.empty()) {
        batch.is_exhausted = false == m_plan.poll_between_batches;
        return batch;
    }

    for (auto const& hit : hits) {
        m_output_handler.write(get_document(hit));
    }
    if (auto const error_code = m_output_handler.flush(); ErrorCode_Success != error_code) {
        SPDLOG_ERROR("Failed to flush output, error_code={}", static_cast<int>(error_code));
        return make_error_code(ErrorCodeEnum::OutputFailure);
    }
    batch.num_hits = hits.size();

    auto const& last_hit = hits.back();
    if (false == last_hit.is_object() || false == last_hit.contains("sort")) {
        SPDLOG_ERROR("Search hit has no sort values");
        return make_error_code(ErrorCodeEnum::ResponseParseFailure);
    }
    batch.next_state.cursor = last_hit.at("sort");

    if (batch.next_state.remaining_budget.has_value()) {
        auto& remaining = batch.next_state.remaining_budget.value();
        remaining -= static_cast<uint32_t>(std::min<size_t>(remaining, batch.num_hits));
        batch.is_exhausted = 0 == remaining;
    }
    return batch;
}

auto BatchPaginator::run(PaginationState state) -> Result<void> {
    uint32_t num_failures{0};
    auto backoff = m_options.poll_interval;
    bool needs_refresh{false};

    auto const handle_failure = [&](std::error_code const& error) -> bool {
        ++num_failures;
        if (false == should_retry(error, num_failures)) {
            return false;
        }
        // The point-in-time may have expired while the service was unreachable
        needs_refresh = true;
        bool const slept = sleep_unless_interrupted(backoff);
        backoff = std::min(backoff * 2, cMaxRetryBackoff);
        return slept;
    };

    while (false == is_interrupted()) {
        if (needs_refresh && nullptr != m_snapshot_manager) {
            auto const refreshed = m_snapshot_manager->refresh();
            if (refreshed.has_error()) {
                if (handle_failure(refreshed.error())) {
                    continue;
                }
                if (is_interrupted()) {
                    break;
                }
                return refreshed.error();
            }
            needs_refresh = false;
        }

        auto const result = step(state, get_current_time());
        if (result.has_error()) {
            if (handle_failure(result.error())) {
                continue;
            }
            if (is_interrupted()) {
                break;
            }
            return result.error();
        }
        num_failures = 0;
        backoff = m_options.poll_interval;

        auto const& batch = result.value();
        SPDLOG_DEBUG("Fetched batch of {} documents", batch.num_hits);
        state = batch.next_state;
        if (batch.is_exhausted) {
            return boost::outcome_v2::success();
        }

        if (m_plan.poll_between_batches) {
            needs_refresh = true;
            if (false == sleep_unless_interrupted(m_options.poll_interval)) {
                break;
            }
        }
    }
    return make_error_code(ErrorCodeEnum::Interrupted);
}

auto BatchPaginator::should_retry(std::error_code const& error, uint32_t num_failures) const
        -> bool {
    if (false == m_plan.poll_between_batches || false == is_transient_error(error)) {
        return false;
    }
    if (num_failures > m_options.max_retries) {
        if (0 < m_options.max_retries) {
            SPDLOG_ERROR("Giving up after {} consecutive failures", num_failures);
        }
        return false;
    }
    SPDLOG_WARN("{}, retrying ({}/{})", error.message(), num_failures, m_options.max_retries);
    return true;
}
}  // namespace esq::search
