#include "CurlGlobalInstance.hpp"

#include <mutex>

#include <curl/curl.h>

#include "../ErrorCode.hpp"

namespace esq::http {
CurlGlobalInstance::CurlGlobalInstance() {
    std::scoped_lock const global_lock{m_ref_count_mutex};
    if (0 == m_ref_count) {
        if (auto const err{curl_global_init(CURL_GLOBAL_ALL)}; CURLE_OK != err) {
            throw OperationFailed(ErrorCode_Failure, __FILE__, __LINE__);
        }
    }
    ++m_ref_count;
}

CurlGlobalInstance::~CurlGlobalInstance() {
    std::scoped_lock const global_lock{m_ref_count_mutex};
    --m_ref_count;
    if (0 == m_ref_count) {
        curl_global_cleanup();
    }
}
}  // namespace esq::http
