#include "ErrorCategory.hpp"

#include <string>
#include <system_error>

namespace esq {
auto ErrorCategory::name() const noexcept -> char const* {
    return "esq";
}

auto ErrorCategory::message(int error_num) const -> std::string {
    switch (static_cast<ErrorCodeEnum>(error_num)) {
        case ErrorCodeEnum::Success:
            return "Success";
        case ErrorCodeEnum::ValidationFailure:
            return "Validation error";
        case ErrorCodeEnum::ConfigFailure:
            return "Configuration error";
        case ErrorCodeEnum::DateParseFailure:
            return "Date error";
        case ErrorCodeEnum::NetworkFailure:
            return "Network error";
        case ErrorCodeEnum::ResponseParseFailure:
            return "Parse error";
        case ErrorCodeEnum::ServerFailure:
            return "Elasticsearch error";
        case ErrorCodeEnum::ServiceUnavailable:
            return "Elasticsearch unavailable";
        case ErrorCodeEnum::Interrupted:
            return "Interrupted";
        case ErrorCodeEnum::OutputFailure:
            return "Output error";
    }
    return "Unknown error";
}

auto get_error_category() -> ErrorCategory const& {
    static ErrorCategory const category;
    return category;
}

auto make_error_code(ErrorCodeEnum error) -> std::error_code {
    return {static_cast<int>(error), get_error_category()};
}

auto is_transient_error(std::error_code const& error) -> bool {
    return make_error_code(ErrorCodeEnum::NetworkFailure) == error
           || make_error_code(ErrorCodeEnum::ServiceUnavailable) == error;
}
}  // namespace esq
