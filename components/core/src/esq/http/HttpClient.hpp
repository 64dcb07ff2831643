#ifndef ESQ_HTTP_HTTPCLIENT_HPP
#define ESQ_HTTP_HTTPCLIENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../ErrorCategory.hpp"

namespace esq::http {
enum class HttpMethod : uint8_t {
    Get = 0,
    Post,
    Put,
    Delete,
};

[[nodiscard]] constexpr auto http_method_to_string(HttpMethod method) -> std::string_view {
    switch (method) {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Post:
            return "POST";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Delete:
            return "DELETE";
    }
    return "GET";
}

struct BasicAuth {
    std::string username;
    std::string password;
};

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    // Sent as application/json when set
    std::optional<std::string> body;
    // Requests that release server-side resources must complete after an interrupt
    bool abort_on_interrupt{true};
};

struct HttpResponse {
    long status_code{0};
    std::string body;

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * Synchronous request/response transport. Implementations only fail for transport problems; any
 * HTTP status is returned as a response.
 */
class HttpClient {
public:
    // Destructor
    virtual ~HttpClient() = default;

    /**
     * @param request
     * @return A result containing the response on success, or an error code indicating the
     * failure:
     * - ErrorCodeEnum::NetworkFailure if the request couldn't be sent or the response couldn't be
     *   received.
     * - ErrorCodeEnum::Interrupted if the transfer was aborted by an interrupt. Only requests with
     *   `abort_on_interrupt` set can be aborted.
     */
    [[nodiscard]] virtual auto send(HttpRequest const& request) -> Result<HttpResponse> = 0;
};
}  // namespace esq::http

#endif  // ESQ_HTTP_HTTPCLIENT_HPP
