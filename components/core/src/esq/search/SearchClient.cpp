#include "SearchClient.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/outcome/success_failure.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "../ErrorCategory.hpp"
#include "../http/HttpClient.hpp"

namespace esq::search {
namespace {
/**
 * @param body
 * @return The most specific reason the service gave for a failed request, or the raw body if it
 * isn't in the service's error format
 */
auto get_failure_reason(std::string const& body) -> std::string {
    auto const decoded = nlohmann::json::parse(body, nullptr, false);
    if (decoded.is_discarded() || false == decoded.is_object() || false == decoded.contains("error"))
    {
        return body;
    }

    auto const& error = decoded.at("error");
    if (error.is_string()) {
        return error.get<std::string>();
    }
    if (error.is_object()) {
        if (error.contains("root_cause") && error.at("root_cause").is_array()
            && false == error.at("root_cause").empty())
        {
            auto const& root_cause = error.at("root_cause").front();
            if (root_cause.contains("reason") && root_cause.at("reason").is_string()) {
                return root_cause.at("reason").get<std::string>();
            }
        }
        if (error.contains("reason") && error.at("reason").is_string()) {
            return error.at("reason").get<std::string>();
        }
    }
    return error.dump();
}

auto decode_body(http::HttpResponse const& response) -> Result<nlohmann::json> {
    auto decoded = nlohmann::json::parse(response.body, nullptr, false);
    if (decoded.is_discarded()) {
        SPDLOG_ERROR("Failed to decode response body as JSON ({} bytes)", response.body.size());
        return make_error_code(ErrorCodeEnum::ResponseParseFailure);
    }
    return boost::outcome_v2::success(std::move(decoded));
}
}  // namespace

SearchClient::SearchClient(http::HttpClient& http_client, std::string base_url, std::string index)
        : m_http_client{http_client},
          m_base_url{std::move(base_url)},
          m_index{std::move(index)} {}

auto SearchClient::search(nlohmann::json const& body) -> Result<nlohmann::json> {
    auto const url = body.contains("pit") ? fmt::format("{}/_search", m_base_url)
                                          : fmt::format("{}/{}/_search", m_base_url, m_index);
    SPDLOG_DEBUG("Search request: {}", body.dump());

    auto const response = send({http::HttpMethod::Post, url, body.dump()});
    if (response.has_error()) {
        return response.error();
    }
    return decode_body(response.value());
}

auto SearchClient::open_point_in_time(std::string_view keep_alive) -> Result<std::string> {
    auto const url = fmt::format("{}/{}/_pit?keep_alive={}", m_base_url, m_index, keep_alive);
    auto const response = send({http::HttpMethod::Post, url, std::nullopt});
    if (response.has_error()) {
        return response.error();
    }

    auto const decoded = decode_body(response.value());
    if (decoded.has_error()) {
        return decoded.error();
    }
    auto const& body = decoded.value();
    if (false == body.is_object() || false == body.contains("id") || false == body.at("id").is_string())
    {
        SPDLOG_ERROR("Point-in-time response for index '{}' has no id", m_index);
        return make_error_code(ErrorCodeEnum::ResponseParseFailure);
    }
    return body.at("id").get<std::string>();
}

auto SearchClient::close_point_in_time(std::string const& id) -> Result<void> {
    nlohmann::json body;
    body["id"] = id;
    http::HttpRequest request{
            http::HttpMethod::Delete,
            fmt::format("{}/_pit", m_base_url),
            body.dump()
    };
    request.abort_on_interrupt = false;
    auto const response = send(request);
    if (response.has_error()) {
        return response.error();
    }
    return boost::outcome_v2::success();
}

auto SearchClient::send(http::HttpRequest const& request) -> Result<http::HttpResponse> {
    auto response = m_http_client.send(request);
    if (response.has_error()) {
        return response.error();
    }

    auto const status_code = response.value().status_code;
    if (false == response.value().is_success()) {
        SPDLOG_ERROR(
                "{} {} returned status {} - {}",
                http::http_method_to_string(request.method),
                request.url,
                status_code,
                get_failure_reason(response.value().body)
        );
        if (status_code >= 500) {
            return make_error_code(ErrorCodeEnum::ServiceUnavailable);
        }
        return make_error_code(ErrorCodeEnum::ServerFailure);
    }
    return response;
}

auto extract_hits(nlohmann::json const& response) -> Result<nlohmann::json> {
    if (false == response.is_object() || false == response.contains("hits")) {
        SPDLOG_ERROR("Search response has no hits");
        return make_error_code(ErrorCodeEnum::ResponseParseFailure);
    }
    auto const& hits = response.at("hits");
    if (false == hits.is_object() || false == hits.contains("hits")
        || false == hits.at("hits").is_array())
    {
        SPDLOG_ERROR("Search response has no hits array");
        return make_error_code(ErrorCodeEnum::ResponseParseFailure);
    }
    return boost::outcome_v2::success(hits.at("hits"));
}
}  // namespace esq::search
