#include "SearchQueryBuilder.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../DateParser.hpp"
#include "../ErrorCategory.hpp"

namespace esq::search {
namespace {
/**
 * @param input
 * @param now
 * @return A result containing `input` in RFC3339 form on success, or an error code indicating
 * the failure:
 * - ErrorCodeEnum::DateParseFailure if `input` isn't a recognized date/time.
 */
auto to_rfc3339(std::string_view input, Timestamp now) -> Result<std::string> {
    auto const timestamp = parse_datetime(input, now);
    if (false == timestamp.has_value()) {
        SPDLOG_ERROR("Failed to parse date '{}'", input);
        return make_error_code(ErrorCodeEnum::DateParseFailure);
    }
    return format_rfc3339(timestamp.value());
}
}  // namespace

auto SearchQueryBuilder::with_sort_order(SortOrder sort_order) const -> SearchQueryBuilder {
    auto builder{*this};
    builder.m_sort_order = std::move(sort_order);
    return builder;
}

auto SearchQueryBuilder::with_size(uint32_t size) const -> SearchQueryBuilder {
    auto builder{*this};
    builder.m_size = size;
    return builder;
}

auto SearchQueryBuilder::with_source_fields(std::optional<std::vector<std::string>> fields) const
        -> SearchQueryBuilder {
    auto builder{*this};
    builder.m_source_fields = std::move(fields);
    return builder;
}

auto SearchQueryBuilder::with_search_after(std::optional<PaginationCursor> cursor) const
        -> SearchQueryBuilder {
    auto builder{*this};
    builder.m_search_after = std::move(cursor);
    return builder;
}

auto SearchQueryBuilder::with_query_match(std::optional<nlohmann::json> match_clause) const
        -> SearchQueryBuilder {
    auto builder{*this};
    builder.m_match_clause = std::move(match_clause);
    return builder;
}

auto SearchQueryBuilder::with_snapshot(std::optional<SnapshotSession> snapshot) const
        -> SearchQueryBuilder {
    auto builder{*this};
    builder.m_snapshot = std::move(snapshot);
    return builder;
}

auto SearchQueryBuilder::with_time_range(
        std::optional<std::string> const& from,
        std::optional<std::string> const& to,
        std::string_view latency,
        Timestamp now
) const -> Result<SearchQueryBuilder> {
    nlohmann::json bounds = nlohmann::json::object();
    if (from.has_value()) {
        auto const gte = to_rfc3339(*from, now);
        if (gte.has_error()) {
            return gte.error();
        }
        bounds["gte"] = gte.value();
    }
    if (to.has_value()) {
        auto const lt = to_rfc3339(*to, now);
        if (lt.has_error()) {
            return lt.error();
        }
        bounds["lt"] = lt.value();
    } else {
        bounds["lt"] = fmt::format("now-{}", latency);
    }

    auto builder{*this};
    nlohmann::json range;
    range["range"][cTimestampField] = std::move(bounds);
    builder.m_range_clause = std::move(range);
    return builder;
}

auto SearchQueryBuilder::with_time_range(
        std::optional<std::string> const& from,
        std::optional<std::string> const& to,
        std::string_view latency
) const -> Result<SearchQueryBuilder> {
    auto const now = std::chrono::time_point_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now()
    );
    return with_time_range(from, to, latency, now);
}

auto SearchQueryBuilder::build() const -> nlohmann::json {
    nlohmann::json body;
    body["size"] = m_size;
    body["sort"] = sort_order_to_json(m_sort_order);

    if (m_range_clause.has_value() && m_match_clause.has_value()) {
        body["query"]["bool"]["must"] = nlohmann::json::array({*m_range_clause, *m_match_clause});
    } else if (m_range_clause.has_value()) {
        body["query"] = *m_range_clause;
    } else if (m_match_clause.has_value()) {
        body["query"] = *m_match_clause;
    }

    if (m_source_fields.has_value()) {
        if (m_source_fields->empty()) {
            body["_source"] = false;
        } else {
            body["_source"] = *m_source_fields;
        }
    }

    if (m_search_after.has_value()) {
        body["search_after"] = *m_search_after;
    }

    if (m_snapshot.has_value()) {
        body["pit"]["id"] = m_snapshot->id;
        body["pit"]["keep_alive"] = m_snapshot->keep_alive;
    }
    return body;
}
}  // namespace esq::search
