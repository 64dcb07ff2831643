#include "ExtractionPlan.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "Defs.hpp"
#include "ErrorCategory.hpp"
#include "search/Defs.hpp"

namespace esq {
namespace {
using search::SortDirection;
using search::SortOrder;

auto split_on(std::string_view input, char delimiter) -> std::vector<std::string> {
    std::string const text{input};
    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, text, boost::algorithm::is_any_of(std::string(1, delimiter)));
    return tokens;
}

auto get_sort_order(bool uses_snapshot) -> SortOrder {
    // The shard-local document order is only exposed within a snapshot
    if (uses_snapshot) {
        return {{cTimestampField, SortDirection::Ascending},
                {cShardDocField, SortDirection::Ascending}};
    }
    return {{cTimestampField, SortDirection::Ascending}};
}

auto validation_failure(std::string_view message) -> std::error_code {
    SPDLOG_ERROR("{}", message);
    return make_error_code(ErrorCodeEnum::ValidationFailure);
}

auto resolve_mode(ExtractionParameters const& parameters) -> Result<ExtractionMode> {
    auto const num_lines = parameters.num_lines;
    if (parameters.around.has_value()) {
        if (parameters.from.has_value() || parameters.to.has_value()) {
            return validation_failure(
                    "The parameters --to and --from cannot be used at the same time as --around."
            );
        }
        if (parameters.follow) {
            return validation_failure(
                    "The parameter --follow cannot be used at the same time as --around."
            );
        }
        if (num_lines > cMaxNumLines) {
            return validation_failure(fmt::format(
                    "In combination with --around, the -n parameter has a maximum value of {}.",
                    cMaxNumLines
            ));
        }
        return ExtractionMode::Around;
    }

    if (parameters.to.has_value()) {
        if (parameters.follow) {
            return validation_failure(
                    "The parameter --follow cannot be used at the same time as --to."
            );
        }
        if (num_lines > cMaxNumLines) {
            return validation_failure(fmt::format(
                    "In combination with --to, the -n parameter has a maximum value of {}.",
                    cMaxNumLines
            ));
        }
        if (parameters.from.has_value()) {
            if (num_lines != cDefaultNumLines) {
                return validation_failure(
                        "You cannot use -n in combination with a full time range (--from and "
                        "--to)."
                );
            }
            return ExtractionMode::FromTo;
        }
        return ExtractionMode::To;
    }

    if (parameters.from.has_value()) {
        if (parameters.follow) {
            return validation_failure(
                    "The parameter --follow cannot be used at the same time as --from."
            );
        }
        return ExtractionMode::From;
    }

    return parameters.follow ? ExtractionMode::Follow : ExtractionMode::None;
}
}  // namespace

auto extraction_mode_to_string(ExtractionMode mode) -> std::string_view {
    switch (mode) {
        case ExtractionMode::Around:
            return "around";
        case ExtractionMode::To:
            return "to";
        case ExtractionMode::From:
            return "from";
        case ExtractionMode::FromTo:
            return "from+to";
        case ExtractionMode::Follow:
            return "follow";
        case ExtractionMode::None:
            return "none";
    }
    return "unknown";
}

auto parse_select_clause(std::string_view select_clause) -> Result<std::vector<std::string>> {
    if (select_clause.empty()) {
        return validation_failure("Select clause cannot be empty");
    }

    std::vector<std::string> fields;
    for (auto& token : split_on(select_clause, ',')) {
        boost::algorithm::trim(token);
        if (false == token.empty()) {
            fields.emplace_back(std::move(token));
        }
    }
    if (fields.empty()) {
        return validation_failure("Select clause must contain at least one field");
    }
    return fields;
}

auto parse_where_clause(std::string_view where_clause) -> Result<std::vector<WhereFilter>> {
    if (where_clause.empty()) {
        return validation_failure("Where clause cannot be empty");
    }

    std::vector<WhereFilter> filters;
    for (auto const& pair : split_on(where_clause, ',')) {
        auto parts = split_on(pair, ':');
        if (2 != parts.size()) {
            return validation_failure(fmt::format(
                    "Invalid where clause format. Expected 'field:value', got '{}'",
                    pair
            ));
        }
        auto field = boost::algorithm::trim_copy(parts[0]);
        auto value = boost::algorithm::trim_copy(parts[1]);
        if (field.empty() || value.empty()) {
            return validation_failure(fmt::format(
                    "Invalid where clause format. Expected 'field:value', got '{}'",
                    pair
            ));
        }
        filters.push_back({std::move(field), std::move(value)});
    }
    return filters;
}

auto generate_match_clause(std::vector<WhereFilter> const& filters) -> nlohmann::json {
    auto const make_match = [](WhereFilter const& filter) {
        nlohmann::json match;
        match["match"][filter.field] = filter.value;
        return match;
    };

    if (filters.empty()) {
        return {{"match_all", nlohmann::json::object()}};
    }
    if (1 == filters.size()) {
        return make_match(filters.front());
    }

    auto must = nlohmann::json::array();
    for (auto const& filter : filters) {
        must.push_back(make_match(filter));
    }
    nlohmann::json bool_query;
    bool_query["bool"]["must"] = std::move(must);
    return bool_query;
}

auto resolve_extraction_plan(ExtractionParameters const& parameters) -> Result<ExtractionPlan> {
    ExtractionPlan plan;

    if (parameters.select_clause.has_value()) {
        auto fields = parse_select_clause(*parameters.select_clause);
        if (fields.has_error()) {
            return fields.error();
        }
        plan.select_fields = std::move(fields.value());
    }

    if (parameters.where_clause.has_value()) {
        auto filters = parse_where_clause(*parameters.where_clause);
        if (filters.has_error()) {
            return filters.error();
        }
        plan.match_clause = generate_match_clause(filters.value());
    }

    auto const mode = resolve_mode(parameters);
    if (mode.has_error()) {
        return mode.error();
    }
    plan.mode = mode.value();

    auto const num_lines = parameters.num_lines;
    switch (plan.mode) {
        case ExtractionMode::Around:
            plan.needs_snapshot = true;
            plan.document_budget = num_lines;
            plan.anchor = Anchor{parameters.around, num_lines / 2};
            break;
        case ExtractionMode::To:
            plan.needs_snapshot = true;
            plan.document_budget = num_lines;
            plan.anchor = Anchor{parameters.to, num_lines};
            plan.time_range.to = parameters.to;
            break;
        case ExtractionMode::FromTo:
            plan.needs_snapshot = true;
            plan.time_range.from = parameters.from;
            plan.time_range.to = parameters.to;
            break;
        case ExtractionMode::From:
            plan.document_budget = num_lines;
            plan.time_range.from = parameters.from;
            break;
        case ExtractionMode::Follow:
            plan.needs_snapshot = true;
            plan.anchor = Anchor{std::nullopt, num_lines};
            plan.poll_between_batches = true;
            break;
        case ExtractionMode::None:
            plan.document_budget = num_lines;
            plan.anchor = Anchor{std::nullopt, num_lines};
            break;
    }
    plan.sort_order = get_sort_order(plan.needs_snapshot);

    SPDLOG_DEBUG(
            "Resolved extraction mode={} snapshot={} budget={}",
            extraction_mode_to_string(plan.mode),
            plan.needs_snapshot,
            plan.document_budget.has_value() ? std::to_string(*plan.document_budget)
                                             : std::string{"unbounded"}
    );
    return plan;
}
}  // namespace esq
