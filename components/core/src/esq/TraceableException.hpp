#ifndef ESQ_TRACEABLEEXCEPTION_HPP
#define ESQ_TRACEABLEEXCEPTION_HPP

#include <exception>
#include <string>
#include <utility>

#include "ErrorCode.hpp"

namespace esq {
/**
 * Base class for exceptions that remember the error code and the source location they were
 * thrown from.
 */
class TraceableException : public std::exception {
public:
    // Constructors
    TraceableException(ErrorCode error_code, char const* const filename, int line_number)
            : m_error_code(error_code),
              m_filename(filename),
              m_line_number(line_number) {}

    TraceableException(
            ErrorCode error_code,
            char const* const filename,
            int line_number,
            std::string message
    )
            : m_error_code(error_code),
              m_filename(filename),
              m_line_number(line_number),
              m_message(std::move(message)) {}

    // Methods
    [[nodiscard]] auto get_error_code() const -> ErrorCode { return m_error_code; }

    [[nodiscard]] auto get_filename() const -> char const* { return m_filename; }

    [[nodiscard]] auto get_line_number() const -> int { return m_line_number; }

    [[nodiscard]] auto what() const noexcept -> char const* override {
        if (m_message.empty()) {
            return "esq::TraceableException";
        }
        return m_message.c_str();
    }

private:
    ErrorCode m_error_code;
    char const* m_filename;
    int m_line_number;
    std::string m_message;
};
}  // namespace esq

#endif  // ESQ_TRACEABLEEXCEPTION_HPP
