#ifndef ESQ_HTTP_CURLGLOBALINSTANCE_HPP
#define ESQ_HTTP_CURLGLOBALINSTANCE_HPP

#include <cstddef>
#include <mutex>

#include "../ErrorCode.hpp"
#include "../TraceableException.hpp"

namespace esq::http {
/**
 * Scoped owner of libcurl's global state. libcurl is initialized when the first instance is
 * created and cleaned up when the last one is destroyed.
 */
class CurlGlobalInstance {
public:
    // Types
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(ErrorCode error_code, char const* const filename, int line_number)
                : TraceableException(error_code, filename, line_number) {}
    };

    // Constructors
    CurlGlobalInstance();

    // Disable copy/move constructors/assignment operators
    CurlGlobalInstance(CurlGlobalInstance const&) = delete;
    CurlGlobalInstance(CurlGlobalInstance&&) = delete;
    auto operator=(CurlGlobalInstance const&) -> CurlGlobalInstance& = delete;
    auto operator=(CurlGlobalInstance&&) -> CurlGlobalInstance& = delete;

    // Destructor
    ~CurlGlobalInstance();

private:
    static inline std::mutex m_ref_count_mutex;
    static inline size_t m_ref_count{0};
};
}  // namespace esq::http

#endif  // ESQ_HTTP_CURLGLOBALINSTANCE_HPP
