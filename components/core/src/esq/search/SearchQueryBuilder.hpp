#ifndef ESQ_SEARCH_SEARCHQUERYBUILDER_HPP
#define ESQ_SEARCH_SEARCHQUERYBUILDER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../DateParser.hpp"
#include "../Defs.hpp"
#include "../ErrorCategory.hpp"
#include "Defs.hpp"

namespace esq::search {
/**
 * Immutable builder for search request bodies. Every `with_*` method returns a modified copy so
 * that a partially configured builder can be shared between the probe and the forward requests.
 */
class SearchQueryBuilder {
public:
    // Constructors
    SearchQueryBuilder() = default;

    // Methods
    [[nodiscard]] auto with_sort_order(SortOrder sort_order) const -> SearchQueryBuilder;

    [[nodiscard]] auto with_size(uint32_t size) const -> SearchQueryBuilder;

    /**
     * @param fields Fields of `_source` to return. An empty list disables `_source` entirely and
     * std::nullopt returns the whole document.
     */
    [[nodiscard]] auto with_source_fields(std::optional<std::vector<std::string>> fields) const
            -> SearchQueryBuilder;

    [[nodiscard]] auto with_search_after(std::optional<PaginationCursor> cursor) const
            -> SearchQueryBuilder;

    [[nodiscard]] auto with_query_match(std::optional<nlohmann::json> match_clause) const
            -> SearchQueryBuilder;

    [[nodiscard]] auto with_snapshot(std::optional<SnapshotSession> snapshot) const
            -> SearchQueryBuilder;

    /**
     * Restricts the results to `[from, to)` on the timestamp field.
     * @param from Lower bound; omitted from the clause when std::nullopt
     * @param to Upper bound; "now" minus `latency` in the service's date math when std::nullopt
     * @param latency
     * @param now Reference point for relative expressions in `from` and `to`
     * @return A result containing the configured builder on success, or an error code
     * indicating the failure:
     * - ErrorCodeEnum::DateParseFailure if `from` or `to` can't be parsed.
     */
    [[nodiscard]] auto with_time_range(
            std::optional<std::string> const& from,
            std::optional<std::string> const& to,
            std::string_view latency,
            Timestamp now
    ) const -> Result<SearchQueryBuilder>;

    /**
     * Same as above, relative to the system clock.
     */
    [[nodiscard]] auto with_time_range(
            std::optional<std::string> const& from,
            std::optional<std::string> const& to,
            std::string_view latency = cIngestionLatency
    ) const -> Result<SearchQueryBuilder>;

    /**
     * @return The request body
     */
    [[nodiscard]] auto build() const -> nlohmann::json;

private:
    SortOrder m_sort_order{{cTimestampField, SortDirection::Ascending}};
    uint32_t m_size{cBatchSize};
    std::optional<std::vector<std::string>> m_source_fields;
    std::optional<PaginationCursor> m_search_after;
    std::optional<nlohmann::json> m_match_clause;
    std::optional<nlohmann::json> m_range_clause;
    std::optional<SnapshotSession> m_snapshot;
};
}  // namespace esq::search

#endif  // ESQ_SEARCH_SEARCHQUERYBUILDER_HPP
