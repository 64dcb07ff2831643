#ifndef ESQ_SEARCH_ANCHORRESOLVER_HPP
#define ESQ_SEARCH_ANCHORRESOLVER_HPP

#include <optional>

#include <nlohmann/json.hpp>

#include "../DateParser.hpp"
#include "../ErrorCategory.hpp"
#include "../ExtractionPlan.hpp"
#include "Defs.hpp"
#include "SearchClient.hpp"

namespace esq::search {
/**
 * Builds the request that looks backwards from the plan's anchor: newest documents first, one
 * more than the probe size, without any `_source`.
 * @param plan A plan with an anchor
 * @param snapshot The open point-in-time, if any
 * @param now Reference point for relative anchor times
 * @return A result containing the request body on success, or an error code indicating the
 * failure:
 * - ErrorCodeEnum::DateParseFailure if the anchor's reference time can't be parsed.
 */
[[nodiscard]] auto build_probe_request(
        ExtractionPlan const& plan,
        std::optional<SnapshotSession> const& snapshot,
        Timestamp now
) -> Result<nlohmann::json>;

/**
 * Finds the cursor from which forward pagination yields the `probe_size` documents preceding the
 * plan's anchor. A single search is sent.
 * @param client
 * @param plan
 * @param snapshot The open point-in-time, if any
 * @param now Reference point for relative anchor times
 * @return A result containing the starting cursor, or std::nullopt when pagination has to start
 * from the first document (no anchor in the plan, not enough documents before the anchor, or a
 * failed probe). On failure, an error code indicating the failure:
 * - ErrorCodeEnum::DateParseFailure if the anchor's reference time can't be parsed.
 * - ErrorCodeEnum::Interrupted if the probe was interrupted.
 */
[[nodiscard]] auto resolve_anchor(
        SearchClient& client,
        ExtractionPlan const& plan,
        std::optional<SnapshotSession> const& snapshot,
        Timestamp now
) -> Result<std::optional<PaginationCursor>>;
}  // namespace esq::search

#endif  // ESQ_SEARCH_ANCHORRESOLVER_HPP
