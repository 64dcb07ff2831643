#ifndef ESQ_SEARCH_SEARCHCLIENT_HPP
#define ESQ_SEARCH_SEARCHCLIENT_HPP

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../ErrorCategory.hpp"
#include "../http/HttpClient.hpp"

namespace esq::search {
/**
 * Issues search and point-in-time requests against a single index of a search service.
 */
class SearchClient {
public:
    // Constructors
    /**
     * @param http_client Transport; must outlive this object
     * @param base_url Service URL without a trailing '/'
     * @param index
     */
    SearchClient(http::HttpClient& http_client, std::string base_url, std::string index);

    // Methods
    [[nodiscard]] auto get_index() const -> std::string const& { return m_index; }

    /**
     * Runs a search. Bodies carrying a point-in-time are sent to the index-less endpoint since
     * the point-in-time already names the index.
     * @param body
     * @return A result containing the decoded response on success, or an error code indicating
     * the failure:
     * - Forwards HttpClient::send's return values on transport failure.
     * - ErrorCodeEnum::ServiceUnavailable if the service answered with a 5xx status.
     * - ErrorCodeEnum::ServerFailure if the service answered with any other non-2xx status.
     * - ErrorCodeEnum::ResponseParseFailure if the response body isn't JSON.
     */
    [[nodiscard]] auto search(nlohmann::json const& body) -> Result<nlohmann::json>;

    /**
     * @param keep_alive
     * @return A result containing the point-in-time id on success, or an error code indicating
     * the failure:
     * - Same as `search`.
     * - ErrorCodeEnum::ResponseParseFailure if the response lacks a string "id".
     */
    [[nodiscard]] auto open_point_in_time(std::string_view keep_alive) -> Result<std::string>;

    /**
     * Releases a point-in-time. The request isn't aborted by an interrupt.
     * @param id
     * @return A void result on success, or an error code indicating the failure:
     * - Same as `search`, except that the response body isn't required to be JSON.
     */
    [[nodiscard]] auto close_point_in_time(std::string const& id) -> Result<void>;

private:
    // Methods
    [[nodiscard]] auto send(http::HttpRequest const& request) -> Result<http::HttpResponse>;

    http::HttpClient& m_http_client;
    std::string m_base_url;
    std::string m_index;
};

/**
 * @param response A decoded search response
 * @return A result containing the `hits.hits` array on success, or an error code indicating the
 * failure:
 * - ErrorCodeEnum::ResponseParseFailure if the response doesn't contain a `hits.hits` array.
 */
[[nodiscard]] auto extract_hits(nlohmann::json const& response) -> Result<nlohmann::json>;
}  // namespace esq::search

#endif  // ESQ_SEARCH_SEARCHCLIENT_HPP
