#ifndef ESQ_ERRORCATEGORY_HPP
#define ESQ_ERRORCATEGORY_HPP

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include <boost/outcome/std_result.hpp>

namespace esq {
/**
 * Failures surfaced by the extraction engine and its collaborators. Every value maps to one
 * user-facing error class; details are logged where the failure is detected.
 */
enum class ErrorCodeEnum : uint8_t {
    Success = 0,
    ValidationFailure,
    ConfigFailure,
    DateParseFailure,
    NetworkFailure,
    ResponseParseFailure,
    ServerFailure,
    ServiceUnavailable,
    Interrupted,
    OutputFailure,
};

class ErrorCategory : public std::error_category {
public:
    [[nodiscard]] auto name() const noexcept -> char const* override;

    [[nodiscard]] auto message(int error_num) const -> std::string override;
};

/**
 * @return The process-wide instance of the esq error category
 */
[[nodiscard]] auto get_error_category() -> ErrorCategory const&;

[[nodiscard]] auto make_error_code(ErrorCodeEnum error) -> std::error_code;

/**
 * @param error
 * @return Whether the failure may go away when the same request is sent again
 */
[[nodiscard]] auto is_transient_error(std::error_code const& error) -> bool;

template <typename T>
using Result = boost::outcome_v2::std_result<T>;
}  // namespace esq

namespace std {
template <>
struct is_error_code_enum<esq::ErrorCodeEnum> : true_type {};
}  // namespace std

#endif  // ESQ_ERRORCATEGORY_HPP
