#include <string>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "../src/esq/ErrorCategory.hpp"
#include "../src/esq/Interrupt.hpp"
#include "../src/esq/http/HttpClient.hpp"
#include "../src/esq/search/SearchClient.hpp"
#include "../src/esq/search/SnapshotManager.hpp"
#include "FakeHttpClient.hpp"

using esq::ErrorCodeEnum;
using esq::http::HttpMethod;
using esq::search::SearchClient;
using esq::search::SnapshotManager;
using esq::tests::FakeHttpClient;
using esq::tests::make_hits;
using esq::tests::make_pit_response;
using esq::tests::make_search_response;
using nlohmann::json;

TEST_CASE("Search endpoints", "[SearchClient]") {
    FakeHttpClient http_client;
    SearchClient client{http_client, "http://localhost:9200", "logs"};

    SECTION("Index search") {
        http_client.add_json_response(make_search_response(make_hits(0, 2)));
        auto const response = client.search(json::parse(R"({"size": 2})"));
        REQUIRE_FALSE(response.has_error());
        REQUIRE(2 == response.value().at("hits").at("hits").size());

        auto const& request = http_client.get_requests().at(0);
        REQUIRE(HttpMethod::Post == request.method);
        REQUIRE(request.url == "http://localhost:9200/logs/_search");
        REQUIRE(http_client.get_request_body(0) == json::parse(R"({"size": 2})"));
    }

    SECTION("Point-in-time search omits the index") {
        http_client.add_json_response(make_search_response(json::array()));
        auto const response = client.search(json::parse(R"({"pit": {"id": "p"}})"));
        REQUIRE_FALSE(response.has_error());
        REQUIRE(http_client.get_requests().at(0).url == "http://localhost:9200/_search");
    }

    SECTION("Service errors") {
        http_client.add_response(
                400,
                R"({"error": {"root_cause": [{"reason": "bad query"}], "reason": "all shards"}})"
        );
        auto const bad_request = client.search(json::object());
        REQUIRE(bad_request.has_error());
        REQUIRE(ErrorCodeEnum::ServerFailure == bad_request.error());

        http_client.add_response(503, "unavailable");
        auto const unavailable = client.search(json::object());
        REQUIRE(unavailable.has_error());
        REQUIRE(ErrorCodeEnum::ServiceUnavailable == unavailable.error());
    }

    SECTION("Transport and decoding errors") {
        http_client.add_failure(ErrorCodeEnum::NetworkFailure);
        REQUIRE(ErrorCodeEnum::NetworkFailure == client.search(json::object()).error());

        http_client.add_response(200, "not json");
        REQUIRE(ErrorCodeEnum::ResponseParseFailure == client.search(json::object()).error());
    }
}

TEST_CASE("extract_hits", "[SearchClient]") {
    auto const hits = esq::search::extract_hits(make_search_response(make_hits(0, 3)));
    REQUIRE_FALSE(hits.has_error());
    REQUIRE(3 == hits.value().size());

    REQUIRE(esq::search::extract_hits(json::parse(R"({"hits": {}})")).has_error());
    REQUIRE(esq::search::extract_hits(json::parse(R"({"timed_out": true})")).has_error());
}

TEST_CASE("Point-in-time requests", "[SearchClient]") {
    FakeHttpClient http_client;
    SearchClient client{http_client, "http://localhost:9200", "logs"};

    SECTION("Open") {
        http_client.add_json_response(make_pit_response("pit-1"));
        auto const id = client.open_point_in_time("1m");
        REQUIRE_FALSE(id.has_error());
        REQUIRE(id.value() == "pit-1");

        auto const& request = http_client.get_requests().at(0);
        REQUIRE(HttpMethod::Post == request.method);
        REQUIRE(request.url == "http://localhost:9200/logs/_pit?keep_alive=1m");
    }

    SECTION("Open without id") {
        http_client.add_json_response(json::parse(R"({"_shards": {}})"));
        auto const id = client.open_point_in_time("1m");
        REQUIRE(id.has_error());
        REQUIRE(ErrorCodeEnum::ResponseParseFailure == id.error());
    }

    SECTION("Close") {
        http_client.add_json_response(json::parse(R"({"succeeded": true})"));
        REQUIRE_FALSE(client.close_point_in_time("pit-1").has_error());

        auto const& request = http_client.get_requests().at(0);
        REQUIRE(HttpMethod::Delete == request.method);
        REQUIRE(request.url == "http://localhost:9200/_pit");
        REQUIRE(http_client.get_request_body(0) == json::parse(R"({"id": "pit-1"})"));
    }
}

TEST_CASE("Snapshot lifecycle", "[SnapshotManager]") {
    FakeHttpClient http_client;
    SearchClient client{http_client, "http://localhost:9200", "logs"};

    SECTION("Every open is closed exactly once") {
        http_client.add_json_response(make_pit_response("pit-1"));
        http_client.add_json_response(json::object());
        http_client.add_json_response(make_pit_response("pit-2"));
        http_client.add_json_response(json::object());
        {
            SnapshotManager snapshot_manager{client};
            REQUIRE_FALSE(snapshot_manager.is_open());
            REQUIRE_FALSE(snapshot_manager.open().has_error());
            REQUIRE(snapshot_manager.get_session()->id == "pit-1");
            REQUIRE(snapshot_manager.get_session()->keep_alive == "1m");

            REQUIRE_FALSE(snapshot_manager.refresh().has_error());
            REQUIRE(snapshot_manager.get_session()->id == "pit-2");
        }
        REQUIRE(2 == http_client.count_requests(HttpMethod::Post, "/_pit"));
        REQUIRE(2 == http_client.count_requests(HttpMethod::Delete, "/_pit"));
        REQUIRE(http_client.get_request_body(1) == json::parse(R"({"id": "pit-1"})"));
        REQUIRE(http_client.get_request_body(3) == json::parse(R"({"id": "pit-2"})"));
    }

    SECTION("Close is idempotent and failures aren't propagated") {
        http_client.add_json_response(make_pit_response("pit-1"));
        http_client.add_response(500, "boom");
        {
            SnapshotManager snapshot_manager{client};
            REQUIRE_FALSE(snapshot_manager.open().has_error());
            snapshot_manager.close();
            REQUIRE_FALSE(snapshot_manager.is_open());
            snapshot_manager.close();
        }
        REQUIRE(1 == http_client.count_requests(HttpMethod::Delete, "/_pit"));
    }

    SECTION("Snapshot is released after an interrupt") {
        http_client.add_json_response(make_pit_response("pit-1"));
        http_client.add_json_response(json::object());
        {
            SnapshotManager snapshot_manager{client};
            REQUIRE_FALSE(snapshot_manager.open().has_error());

            esq::set_interrupted(true);
            auto const response = client.search(json::parse(R"({"size": 1})"));
            REQUIRE(response.has_error());
            REQUIRE(ErrorCodeEnum::Interrupted == response.error());
        }
        esq::set_interrupted(false);

        REQUIRE(1 == http_client.count_requests(HttpMethod::Delete, "/_pit"));
        REQUIRE(0 == http_client.get_num_pending_responses());
        REQUIRE_FALSE(http_client.get_requests().back().abort_on_interrupt);
    }

    SECTION("Failed open leaves nothing to close") {
        http_client.add_response(404, R"({"error": "no such index"})");
        {
            SnapshotManager snapshot_manager{client};
            auto const opened = snapshot_manager.open();
            REQUIRE(opened.has_error());
            REQUIRE(ErrorCodeEnum::ServerFailure == opened.error());
            REQUIRE_FALSE(snapshot_manager.is_open());
        }
        REQUIRE(0 == http_client.count_requests(HttpMethod::Delete, "/_pit"));
    }
}
