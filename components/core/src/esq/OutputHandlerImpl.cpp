#include "OutputHandlerImpl.hpp"

#include <nlohmann/json.hpp>

#include "ErrorCode.hpp"

namespace esq {
void StandardOutputHandler::write(nlohmann::json const& document) {
    // Invalid UTF-8 in a document is replaced rather than failing the whole extraction
    m_stream << document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

auto StandardOutputHandler::flush() -> ErrorCode {
    m_stream.flush();
    if (m_stream.fail()) {
        return ErrorCode_Failure;
    }
    return ErrorCode_Success;
}
}  // namespace esq
