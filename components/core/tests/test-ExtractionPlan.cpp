#include <optional>
#include <string>
#include <vector>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "../src/esq/Defs.hpp"
#include "../src/esq/ErrorCategory.hpp"
#include "../src/esq/ExtractionPlan.hpp"
#include "../src/esq/search/Defs.hpp"

using esq::ErrorCodeEnum;
using esq::ExtractionMode;
using esq::ExtractionParameters;
using esq::resolve_extraction_plan;
using esq::search::SortDirection;
using esq::search::SortKey;

namespace {
auto is_validation_failure(ExtractionParameters const& parameters) -> bool {
    auto const result = resolve_extraction_plan(parameters);
    return result.has_error() && ErrorCodeEnum::ValidationFailure == result.error();
}
}  // namespace

TEST_CASE("parse_select_clause", "[ExtractionPlan]") {
    SECTION("Fields are trimmed") {
        auto const fields = esq::parse_select_clause("f1, f2 ,f3");
        REQUIRE_FALSE(fields.has_error());
        REQUIRE(fields.value() == std::vector<std::string>{"f1", "f2", "f3"});
    }

    SECTION("Empty fields are dropped") {
        auto const fields = esq::parse_select_clause("message,, ,host");
        REQUIRE_FALSE(fields.has_error());
        REQUIRE(fields.value() == std::vector<std::string>{"message", "host"});
    }

    SECTION("Empty clause is rejected") {
        auto const fields = esq::parse_select_clause("");
        REQUIRE(fields.has_error());
        REQUIRE(ErrorCodeEnum::ValidationFailure == fields.error());
    }

    SECTION("Clause without any field is rejected") {
        REQUIRE(esq::parse_select_clause(" , ,").has_error());
    }
}

TEST_CASE("parse_where_clause", "[ExtractionPlan]") {
    SECTION("Pairs are split and trimmed") {
        auto const filters = esq::parse_where_clause("a:1, b : 2");
        REQUIRE_FALSE(filters.has_error());
        REQUIRE(filters.value()
                == std::vector<esq::WhereFilter>{{"a", "1"}, {"b", "2"}});
    }

    SECTION("A single malformed pair rejects the whole clause") {
        REQUIRE(esq::parse_where_clause("a:1,bad").has_error());
        REQUIRE(esq::parse_where_clause("a:1,b:").has_error());
        REQUIRE(esq::parse_where_clause(":1").has_error());
        REQUIRE(esq::parse_where_clause("url:http://host").has_error());
    }

    SECTION("Empty clause is rejected") {
        auto const filters = esq::parse_where_clause("");
        REQUIRE(filters.has_error());
        REQUIRE(ErrorCodeEnum::ValidationFailure == filters.error());
    }
}

TEST_CASE("generate_match_clause", "[ExtractionPlan]") {
    SECTION("No filter matches everything") {
        REQUIRE(esq::generate_match_clause({})
                == nlohmann::json::parse(R"({"match_all": {}})"));
    }

    SECTION("One filter is a single match") {
        REQUIRE(esq::generate_match_clause({{"level", "error"}})
                == nlohmann::json::parse(R"({"match": {"level": "error"}})"));
    }

    SECTION("Several filters must all match") {
        auto const expected = nlohmann::json::parse(
                R"({"bool": {"must": [{"match": {"a": "1"}}, {"match": {"b": "2"}}]}})"
        );
        REQUIRE(esq::generate_match_clause({{"a", "1"}, {"b", "2"}}) == expected);
    }
}

TEST_CASE("Conflicting time options are rejected", "[ExtractionPlan]") {
    ExtractionParameters parameters;

    SECTION("around with from") {
        parameters.around = "2024-01-01";
        parameters.from = "2024-01-01";
        REQUIRE(is_validation_failure(parameters));
    }

    SECTION("around with to") {
        parameters.around = "2024-01-01";
        parameters.to = "2024-01-02";
        REQUIRE(is_validation_failure(parameters));
    }

    SECTION("around with follow") {
        parameters.around = "2024-01-01";
        parameters.follow = true;
        REQUIRE(is_validation_failure(parameters));
    }

    SECTION("to with follow") {
        parameters.to = "2024-01-01";
        parameters.follow = true;
        REQUIRE(is_validation_failure(parameters));
    }

    SECTION("from with follow") {
        parameters.from = "2024-01-01";
        parameters.follow = true;
        REQUIRE(is_validation_failure(parameters));
    }
}

TEST_CASE("Line count limits", "[ExtractionPlan]") {
    ExtractionParameters parameters;

    SECTION("around") {
        parameters.around = "2024-01-01";
        parameters.num_lines = esq::cMaxNumLines + 1;
        REQUIRE(is_validation_failure(parameters));
        parameters.num_lines = esq::cMaxNumLines;
        REQUIRE_FALSE(resolve_extraction_plan(parameters).has_error());
    }

    SECTION("to") {
        parameters.to = "2024-01-01";
        parameters.num_lines = esq::cMaxNumLines + 1;
        REQUIRE(is_validation_failure(parameters));
        parameters.num_lines = esq::cMaxNumLines;
        REQUIRE_FALSE(resolve_extraction_plan(parameters).has_error());
    }

    SECTION("from and to") {
        parameters.from = "2024-01-01";
        parameters.to = "2024-01-02";
        parameters.num_lines = 20;
        REQUIRE(is_validation_failure(parameters));
        parameters.num_lines = esq::cDefaultNumLines;
        auto const plan = resolve_extraction_plan(parameters);
        REQUIRE_FALSE(plan.has_error());
        REQUIRE(ExtractionMode::FromTo == plan.value().mode);
    }

    SECTION("from alone isn't limited") {
        parameters.from = "2024-01-01";
        parameters.num_lines = esq::cMaxNumLines * 2;
        REQUIRE_FALSE(resolve_extraction_plan(parameters).has_error());
    }
}

TEST_CASE("Modes derive their retrieval behaviour", "[ExtractionPlan]") {
    ExtractionParameters parameters;
    parameters.num_lines = 20;
    std::vector<SortKey> const snapshot_sort{
            {esq::cTimestampField, SortDirection::Ascending},
            {esq::cShardDocField, SortDirection::Ascending}
    };
    std::vector<SortKey> const plain_sort{{esq::cTimestampField, SortDirection::Ascending}};

    SECTION("around") {
        parameters.around = "2024-01-01 12:00";
        auto const result = resolve_extraction_plan(parameters);
        REQUIRE_FALSE(result.has_error());
        auto const& plan = result.value();
        REQUIRE(ExtractionMode::Around == plan.mode);
        REQUIRE(plan.needs_snapshot);
        REQUIRE(plan.document_budget == std::optional<uint32_t>{20});
        REQUIRE(plan.anchor.has_value());
        REQUIRE(plan.anchor->reference_time == parameters.around);
        REQUIRE(10 == plan.anchor->probe_size);
        REQUIRE_FALSE(plan.time_range.from.has_value());
        REQUIRE_FALSE(plan.time_range.to.has_value());
        REQUIRE_FALSE(plan.poll_between_batches);
        REQUIRE(plan.sort_order == snapshot_sort);
    }

    SECTION("to") {
        parameters.to = "2024-01-01";
        auto const result = resolve_extraction_plan(parameters);
        REQUIRE_FALSE(result.has_error());
        auto const& plan = result.value();
        REQUIRE(ExtractionMode::To == plan.mode);
        REQUIRE(plan.needs_snapshot);
        REQUIRE(plan.document_budget == std::optional<uint32_t>{20});
        REQUIRE(plan.anchor->reference_time == parameters.to);
        REQUIRE(20 == plan.anchor->probe_size);
        REQUIRE(plan.time_range.to == parameters.to);
        REQUIRE(plan.sort_order == snapshot_sort);
    }

    SECTION("from and to") {
        parameters.num_lines = esq::cDefaultNumLines;
        parameters.from = "2024-01-01";
        parameters.to = "2024-01-02";
        auto const result = resolve_extraction_plan(parameters);
        REQUIRE_FALSE(result.has_error());
        auto const& plan = result.value();
        REQUIRE(plan.needs_snapshot);
        REQUIRE_FALSE(plan.document_budget.has_value());
        REQUIRE_FALSE(plan.anchor.has_value());
        REQUIRE(plan.time_range.from == parameters.from);
        REQUIRE(plan.time_range.to == parameters.to);
    }

    SECTION("from") {
        parameters.from = "2024-01-01";
        auto const result = resolve_extraction_plan(parameters);
        REQUIRE_FALSE(result.has_error());
        auto const& plan = result.value();
        REQUIRE(ExtractionMode::From == plan.mode);
        REQUIRE_FALSE(plan.needs_snapshot);
        REQUIRE(plan.document_budget == std::optional<uint32_t>{20});
        REQUIRE_FALSE(plan.anchor.has_value());
        REQUIRE(plan.sort_order == plain_sort);
    }

    SECTION("follow") {
        parameters.follow = true;
        auto const result = resolve_extraction_plan(parameters);
        REQUIRE_FALSE(result.has_error());
        auto const& plan = result.value();
        REQUIRE(ExtractionMode::Follow == plan.mode);
        REQUIRE(plan.needs_snapshot);
        REQUIRE_FALSE(plan.document_budget.has_value());
        REQUIRE_FALSE(plan.anchor->reference_time.has_value());
        REQUIRE(20 == plan.anchor->probe_size);
        REQUIRE(plan.poll_between_batches);
    }

    SECTION("none") {
        auto const result = resolve_extraction_plan(parameters);
        REQUIRE_FALSE(result.has_error());
        auto const& plan = result.value();
        REQUIRE(ExtractionMode::None == plan.mode);
        REQUIRE_FALSE(plan.needs_snapshot);
        REQUIRE(plan.document_budget == std::optional<uint32_t>{20});
        REQUIRE(20 == plan.anchor->probe_size);
        REQUIRE_FALSE(plan.poll_between_batches);
        REQUIRE(plan.sort_order == plain_sort);
    }
}

TEST_CASE("Select and where clauses flow into the plan", "[ExtractionPlan]") {
    ExtractionParameters parameters;
    parameters.select_clause = "message, host";
    parameters.where_clause = "level:error";

    auto const result = resolve_extraction_plan(parameters);
    REQUIRE_FALSE(result.has_error());
    auto const& plan = result.value();
    REQUIRE(plan.select_fields == std::vector<std::string>{"message", "host"});
    REQUIRE(plan.match_clause == nlohmann::json::parse(R"({"match": {"level": "error"}})"));

    SECTION("A bad clause fails the whole plan") {
        parameters.where_clause = "level";
        REQUIRE(is_validation_failure(parameters));
    }
}
