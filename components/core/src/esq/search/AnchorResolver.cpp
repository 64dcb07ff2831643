#include "AnchorResolver.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <boost/outcome/success_failure.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../Defs.hpp"
#include "../ErrorCategory.hpp"
#include "SearchQueryBuilder.hpp"

namespace esq::search {
auto build_probe_request(
        ExtractionPlan const& plan,
        std::optional<SnapshotSession> const& snapshot,
        Timestamp now
) -> Result<nlohmann::json> {
    auto const probe_size = plan.anchor.has_value() ? plan.anchor->probe_size : 0U;
    auto const reference_time
            = plan.anchor.has_value() ? plan.anchor->reference_time : std::nullopt;

    auto const builder
            = SearchQueryBuilder{}
                      .with_sort_order(reverse_sort_order(plan.sort_order))
                      .with_size(probe_size + 1)
                      .with_source_fields(std::vector<std::string>{})
                      .with_query_match(plan.match_clause)
                      .with_snapshot(snapshot)
                      .with_time_range(std::nullopt, reference_time, cIngestionLatency, now);
    if (builder.has_error()) {
        return builder.error();
    }
    return boost::outcome_v2::success(builder.value().build());
}

auto resolve_anchor(
        SearchClient& client,
        ExtractionPlan const& plan,
        std::optional<SnapshotSession> const& snapshot,
        Timestamp now
) -> Result<std::optional<PaginationCursor>> {
    if (false == plan.anchor.has_value()) {
        return std::optional<PaginationCursor>{};
    }

    auto const request = build_probe_request(plan, snapshot, now);
    if (request.has_error()) {
        return request.error();
    }

    auto const response = client.search(request.value());
    if (response.has_error()) {
        if (ErrorCodeEnum::Interrupted == response.error()) {
            return response.error();
        }
        SPDLOG_WARN(
                "Failed to locate the anchor, reading from the first document - {}",
                response.error().message()
        );
        return std::optional<PaginationCursor>{};
    }

    auto const hits = extract_hits(response.value());
    if (hits.has_error()) {
        SPDLOG_WARN("Failed to locate the anchor, reading from the first document");
        return std::optional<PaginationCursor>{};
    }

    auto const& hit_array = hits.value();
    auto const num_requested = static_cast<size_t>(plan.anchor->probe_size) + 1;
    if (hit_array.size() < num_requested) {
        // The window reaches back to the first document
        SPDLOG_DEBUG("Anchor probe found {} of {} documents", hit_array.size(), num_requested);
        return std::optional<PaginationCursor>{};
    }

    auto const& last_hit = hit_array.back();
    if (false == last_hit.is_object() || false == last_hit.contains("sort")) {
        SPDLOG_WARN("Anchor probe hit has no sort values, reading from the first document");
        return std::optional<PaginationCursor>{};
    }
    SPDLOG_DEBUG("Anchor cursor: {}", last_hit.at("sort").dump());
    return boost::outcome_v2::success(std::optional<PaginationCursor>{last_hit.at("sort")});
}
}  // namespace esq::search
