#ifndef ESQ_SEARCH_DEFS_HPP
#define ESQ_SEARCH_DEFS_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace esq::search {
enum class SortDirection : uint8_t {
    Ascending = 0,
    Descending,
};

struct SortKey {
    std::string field;
    SortDirection direction{SortDirection::Ascending};

    auto operator==(SortKey const&) const -> bool = default;
};

using SortOrder = std::vector<SortKey>;

/**
 * Sort values of the last document of a batch, as returned by the service in each hit's "sort"
 * array. Only meaningful to the service; passed back verbatim as "search_after".
 */
using PaginationCursor = nlohmann::json;

/**
 * Server-side consistent point-in-time read context.
 */
struct SnapshotSession {
    std::string id;
    std::string keep_alive;
};

/**
 * @param sort_order
 * @return `sort_order` in the service's notation, e.g. [{"@timestamp": {"order": "asc"}}]
 */
inline auto sort_order_to_json(SortOrder const& sort_order) -> nlohmann::json {
    auto sort = nlohmann::json::array();
    for (auto const& key : sort_order) {
        nlohmann::json entry;
        entry[key.field]["order"] = SortDirection::Ascending == key.direction ? "asc" : "desc";
        sort.push_back(std::move(entry));
    }
    return sort;
}

/**
 * @param sort_order
 * @return `sort_order` with every key's direction flipped
 */
inline auto reverse_sort_order(SortOrder sort_order) -> SortOrder {
    for (auto& key : sort_order) {
        key.direction = SortDirection::Ascending == key.direction ? SortDirection::Descending
                                                                  : SortDirection::Ascending;
    }
    return sort_order;
}
}  // namespace esq::search

#endif  // ESQ_SEARCH_DEFS_HPP
