#include <algorithm>
#include <chrono>
#include <string>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "../src/esq/CatCommand.hpp"
#include "../src/esq/Config.hpp"
#include "../src/esq/ErrorCategory.hpp"
#include "../src/esq/Interrupt.hpp"
#include "../src/esq/http/HttpClient.hpp"
#include "FakeHttpClient.hpp"

using esq::CatOptions;
using esq::Config;
using esq::ErrorCodeEnum;
using esq::http::HttpMethod;
using esq::run_cat_command;
using esq::tests::FakeHttpClient;
using esq::tests::InterruptingOutputHandler;
using esq::tests::make_hits;
using esq::tests::make_pit_response;
using esq::tests::make_search_response;
using esq::tests::RecordingOutputHandler;
using nlohmann::json;

namespace {
auto make_config() -> Config {
    Config config;
    config.url = "http://localhost:9200";
    return config;
}

auto make_cat_options() -> CatOptions {
    CatOptions options;
    options.index = "logs";
    options.paginator_options.poll_interval = std::chrono::milliseconds{0};
    return options;
}
}  // namespace

TEST_CASE("Invalid options are rejected before any request", "[CatCommand]") {
    FakeHttpClient http_client;
    RecordingOutputHandler output_handler;
    auto options = make_cat_options();

    SECTION("Conflicting options") {
        options.parameters.around = "2024-01-01";
        options.parameters.follow = true;
        auto const result = run_cat_command(http_client, make_config(), options, output_handler);
        REQUIRE(result.has_error());
        REQUIRE(ErrorCodeEnum::ValidationFailure == result.error());
    }

    SECTION("Unparseable date") {
        options.parameters.from = "2024-01-01";
        options.parameters.to = "the day after";
        auto const result = run_cat_command(http_client, make_config(), options, output_handler);
        REQUIRE(result.has_error());
        REQUIRE(ErrorCodeEnum::DateParseFailure == result.error());
    }

    REQUIRE(http_client.get_requests().empty());
}

TEST_CASE("Latest documents without a snapshot", "[CatCommand]") {
    FakeHttpClient http_client;
    RecordingOutputHandler output_handler;
    auto options = make_cat_options();
    options.parameters.num_lines = 3;

    // Probe: 4 newest documents, newest first
    auto probe_hits = make_hits(6, 4);
    std::reverse(probe_hits.begin(), probe_hits.end());
    http_client.add_json_response(make_search_response(probe_hits));
    http_client.add_json_response(make_search_response(make_hits(7, 3)));

    auto const result = run_cat_command(http_client, make_config(), options, output_handler);
    REQUIRE_FALSE(result.has_error());

    REQUIRE(2 == http_client.get_requests().size());
    REQUIRE(0 == http_client.count_requests(HttpMethod::Post, "/_pit"));
    REQUIRE(http_client.get_requests().at(1).url == "http://localhost:9200/logs/_search");
    REQUIRE(http_client.get_request_body(1).at("search_after") == json::array({6, 6}));

    auto const& documents = output_handler.get_documents();
    REQUIRE(3 == documents.size());
    REQUIRE(7 == documents.front().at("id"));
    REQUIRE(9 == documents.back().at("id"));
}

TEST_CASE("Around a point in time", "[CatCommand]") {
    FakeHttpClient http_client;
    RecordingOutputHandler output_handler;
    auto options = make_cat_options();
    options.parameters.around = "2024-01-01T12:00:00Z";
    options.parameters.num_lines = 4;

    http_client.add_json_response(make_pit_response("pit-1"));
    http_client.add_json_response(make_search_response(make_hits(0, 3)));
    http_client.add_json_response(make_search_response(make_hits(3, 4)));
    http_client.add_json_response(json::object());

    auto const result = run_cat_command(http_client, make_config(), options, output_handler);
    REQUIRE_FALSE(result.has_error());

    auto const& requests = http_client.get_requests();
    REQUIRE(4 == requests.size());
    REQUIRE(requests.at(0).url == "http://localhost:9200/logs/_pit?keep_alive=1m");

    auto const probe = http_client.get_request_body(1);
    REQUIRE(3 == probe.at("size"));
    REQUIRE(probe.at("query").at("range").at("@timestamp").at("lt")
            == "2024-01-01T12:00:00+00:00");

    auto const forward = http_client.get_request_body(2);
    REQUIRE(requests.at(2).url == "http://localhost:9200/_search");
    REQUIRE(forward.at("search_after") == json::array({2, 2}));
    REQUIRE(forward.at("pit").at("id") == "pit-1");
    REQUIRE(forward.at("query").at("range").at("@timestamp").at("lt") == "now-1m");

    REQUIRE(HttpMethod::Delete == requests.at(3).method);
    REQUIRE(4 == output_handler.get_documents().size());
}

TEST_CASE("Snapshot is released when the extraction fails", "[CatCommand]") {
    FakeHttpClient http_client;
    RecordingOutputHandler output_handler;
    auto options = make_cat_options();
    options.parameters.from = "2024-01-01";
    options.parameters.to = "2024-01-02";

    http_client.add_json_response(make_pit_response("pit-1"));
    http_client.add_json_response(make_search_response(make_hits(0, 2)));
    http_client.add_response(400, R"({"error": {"reason": "too many buckets"}})");
    http_client.add_json_response(json::object());

    auto const result = run_cat_command(http_client, make_config(), options, output_handler);
    REQUIRE(result.has_error());
    REQUIRE(ErrorCodeEnum::ServerFailure == result.error());

    REQUIRE(1 == http_client.count_requests(HttpMethod::Post, "/_pit"));
    REQUIRE(1 == http_client.count_requests(HttpMethod::Delete, "/_pit"));
    REQUIRE(2 == output_handler.get_documents().size());
}

TEST_CASE("Interrupted follow ends successfully", "[CatCommand]") {
    FakeHttpClient http_client;
    InterruptingOutputHandler output_handler{1};
    auto options = make_cat_options();
    options.parameters.follow = true;
    options.parameters.num_lines = 2;

    http_client.add_json_response(make_pit_response("pit-1"));
    http_client.add_json_response(make_search_response(make_hits(0, 1)));
    http_client.add_json_response(make_search_response(make_hits(0, 1)));
    http_client.add_json_response(json::object());

    auto const result = run_cat_command(http_client, make_config(), options, output_handler);
    esq::set_interrupted(false);
    REQUIRE_FALSE(result.has_error());

    REQUIRE(1 == output_handler.get_documents().size());
    REQUIRE(1 == http_client.count_requests(HttpMethod::Post, "/_pit"));
    REQUIRE(1 == http_client.count_requests(HttpMethod::Delete, "/_pit"));
    // The release went through even though the interrupt flag was still raised
    REQUIRE(0 == http_client.get_num_pending_responses());
}
