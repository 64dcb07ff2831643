#ifndef ESQ_HTTP_CURLHTTPCLIENT_HPP
#define ESQ_HTTP_CURLHTTPCLIENT_HPP

#include <memory>
#include <optional>

#include <curl/curl.h>

#include "../Defs.hpp"
#include "../ErrorCategory.hpp"
#include "../ErrorCode.hpp"
#include "../TraceableException.hpp"
#include "HttpClient.hpp"

namespace esq::http {
/**
 * HttpClient backed by a single reused libcurl easy handle. Requires a live CurlGlobalInstance.
 */
class CurlHttpClient : public HttpClient {
public:
    // Types
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(ErrorCode error_code, char const* const filename, int line_number)
                : TraceableException(error_code, filename, line_number) {}
    };

    // Constructors
    /**
     * @param auth Credentials sent with every request, if any
     * @param connect_timeout_seconds
     * @throw CurlHttpClient::OperationFailed if the easy handle couldn't be created
     */
    explicit CurlHttpClient(
            std::optional<BasicAuth> auth,
            long connect_timeout_seconds = cConnectTimeoutSeconds
    );

    // Methods
    [[nodiscard]] auto send(HttpRequest const& request) -> Result<HttpResponse> override;

private:
    struct EasyHandleDeleter {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    struct HeaderListDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    std::unique_ptr<CURL, EasyHandleDeleter> m_handle;
    std::unique_ptr<curl_slist, HeaderListDeleter> m_json_headers;
    std::optional<BasicAuth> m_auth;
    long m_connect_timeout_seconds;
};
}  // namespace esq::http

#endif  // ESQ_HTTP_CURLHTTPCLIENT_HPP
