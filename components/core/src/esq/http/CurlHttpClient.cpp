#include "CurlHttpClient.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "../Defs.hpp"
#include "../ErrorCategory.hpp"
#include "../Interrupt.hpp"

namespace esq::http {
namespace {
auto on_write(char* ptr, size_t size, size_t nmemb, void* user_data) -> size_t {
    auto* body = static_cast<std::string*>(user_data);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

/**
 * Aborts the transfer once an interrupt has been requested.
 */
auto on_progress(
        void* /*user_data*/,
        curl_off_t /*dltotal*/,
        curl_off_t /*dlnow*/,
        curl_off_t /*ultotal*/,
        curl_off_t /*ulnow*/
) -> int {
    return is_interrupted() ? 1 : 0;
}
}  // namespace

CurlHttpClient::CurlHttpClient(std::optional<BasicAuth> auth, long connect_timeout_seconds)
        : m_handle{curl_easy_init()},
          m_auth{std::move(auth)},
          m_connect_timeout_seconds{connect_timeout_seconds} {
    if (nullptr == m_handle) {
        throw OperationFailed(ErrorCode_NotInit, __FILE__, __LINE__);
    }

    curl_slist* headers{nullptr};
    for (auto const* header : {"Content-Type: application/json", "Accept: application/json"}) {
        auto* appended = curl_slist_append(headers, header);
        if (nullptr == appended) {
            curl_slist_free_all(headers);
            throw OperationFailed(ErrorCode_NoMem, __FILE__, __LINE__);
        }
        headers = appended;
    }
    m_json_headers.reset(headers);
}

auto CurlHttpClient::send(HttpRequest const& request) -> Result<HttpResponse> {
    auto* handle = m_handle.get();
    curl_easy_reset(handle);

    HttpResponse response;
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, m_connect_timeout_seconds);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, on_write);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    if (request.abort_on_interrupt) {
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, on_progress);
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    } else {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT, cUninterruptibleTimeoutSeconds);
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, m_json_headers.get());

    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Post:
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            break;
        case HttpMethod::Put:
        case HttpMethod::Delete:
            curl_easy_setopt(
                    handle,
                    CURLOPT_CUSTOMREQUEST,
                    http_method_to_string(request.method).data()
            );
            break;
    }

    if (request.body.has_value()) {
        curl_easy_setopt(
                handle,
                CURLOPT_POSTFIELDSIZE_LARGE,
                static_cast<curl_off_t>(request.body->size())
        );
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body->c_str());
    } else if (HttpMethod::Post == request.method) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, 0L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, "");
    }

    if (m_auth.has_value()) {
        curl_easy_setopt(handle, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(handle, CURLOPT_USERNAME, m_auth->username.c_str());
        curl_easy_setopt(handle, CURLOPT_PASSWORD, m_auth->password.c_str());
    }

    SPDLOG_TRACE("{} {}", http_method_to_string(request.method), request.url);
    auto const curl_code = curl_easy_perform(handle);
    if (CURLE_ABORTED_BY_CALLBACK == curl_code) {
        SPDLOG_DEBUG("Transfer to {} aborted by interrupt", request.url);
        return make_error_code(ErrorCodeEnum::Interrupted);
    }
    if (CURLE_OK != curl_code) {
        SPDLOG_ERROR(
                "{} {} failed - curl: {}",
                http_method_to_string(request.method),
                request.url,
                curl_easy_strerror(curl_code)
        );
        return make_error_code(ErrorCodeEnum::NetworkFailure);
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_code);
    SPDLOG_TRACE("Response status={} size={}", response.status_code, response.body.size());
    return response;
}
}  // namespace esq::http
