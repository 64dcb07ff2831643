#ifndef ESQ_EXTRACTIONPLAN_HPP
#define ESQ_EXTRACTIONPLAN_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "Defs.hpp"
#include "ErrorCategory.hpp"
#include "search/Defs.hpp"

namespace esq {
/**
 * Which combination of time options the user gave; determines how documents are located.
 */
enum class ExtractionMode : uint8_t {
    Around = 0,
    To,
    From,
    FromTo,
    Follow,
    None,
};

[[nodiscard]] auto extraction_mode_to_string(ExtractionMode mode) -> std::string_view;

struct WhereFilter {
    std::string field;
    std::string value;

    auto operator==(WhereFilter const&) const -> bool = default;
};

/**
 * Point to seek back from before paginating forward. Without a reference time, the probe starts
 * from the live edge ("now" minus the ingestion latency).
 */
struct Anchor {
    std::optional<std::string> reference_time;
    uint32_t probe_size{0};
};

/**
 * Unparsed bounds of the forward range; an absent upper bound means the live edge.
 */
struct TimeRange {
    std::optional<std::string> from;
    std::optional<std::string> to;
};

/**
 * Raw option values as given on the command line.
 */
struct ExtractionParameters {
    std::optional<std::string> around;
    std::optional<std::string> from;
    std::optional<std::string> to;
    uint32_t num_lines{cDefaultNumLines};
    bool follow{false};
    std::optional<std::string> select_clause;
    std::optional<std::string> where_clause;
};

struct ExtractionPlan {
    ExtractionMode mode{ExtractionMode::None};
    bool needs_snapshot{false};
    // std::nullopt means unbounded
    std::optional<uint32_t> document_budget;
    std::optional<nlohmann::json> match_clause;
    std::optional<Anchor> anchor;
    search::SortOrder sort_order;
    bool poll_between_batches{false};
    std::optional<std::vector<std::string>> select_fields;
    TimeRange time_range;
};

/**
 * Splits a comma-separated list of field names, trimming each and dropping empty ones.
 * @param select_clause
 * @return A result containing the field names on success, or an error code indicating the
 * failure:
 * - ErrorCodeEnum::ValidationFailure if the clause is empty or has no non-empty field.
 */
[[nodiscard]] auto parse_select_clause(std::string_view select_clause)
        -> Result<std::vector<std::string>>;

/**
 * Splits a comma-separated list of `field:value` pairs. A single malformed pair rejects the whole
 * clause.
 * @param where_clause
 * @return A result containing the filters on success, or an error code indicating the failure:
 * - ErrorCodeEnum::ValidationFailure if the clause is empty, or a pair doesn't contain exactly
 *   one ':' with a non-empty field and value on either side.
 */
[[nodiscard]] auto parse_where_clause(std::string_view where_clause)
        -> Result<std::vector<WhereFilter>>;

/**
 * @param filters
 * @return `match_all` for no filters, a single `match` for one filter, or a `bool.must` of
 * `match` clauses otherwise.
 */
[[nodiscard]] auto generate_match_clause(std::vector<WhereFilter> const& filters)
        -> nlohmann::json;

/**
 * Validates the option combination and derives the retrieval plan. Does not touch the network
 * and doesn't parse any date.
 * @param parameters
 * @return A result containing the plan on success, or an error code indicating the failure:
 * - ErrorCodeEnum::ValidationFailure if the options conflict, a line count is out of bounds, or
 *   the select/where clauses are malformed.
 */
[[nodiscard]] auto resolve_extraction_plan(ExtractionParameters const& parameters)
        -> Result<ExtractionPlan>;
}  // namespace esq

#endif  // ESQ_EXTRACTIONPLAN_HPP
