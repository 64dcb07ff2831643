#ifndef ESQ_OUTPUTHANDLERIMPL_HPP
#define ESQ_OUTPUTHANDLERIMPL_HPP

#include <iostream>
#include <ostream>

#include <nlohmann/json.hpp>

#include "ErrorCode.hpp"
#include "search/OutputHandler.hpp"

namespace esq {
/**
 * Output handler that writes each document as one line of compact JSON.
 */
class StandardOutputHandler : public search::OutputHandler {
public:
    // Constructors
    explicit StandardOutputHandler(std::ostream& stream = std::cout) : m_stream{stream} {}

    // Methods inherited from OutputHandler
    void write(nlohmann::json const& document) override;

    auto flush() -> ErrorCode override;

private:
    std::ostream& m_stream;
};
}  // namespace esq

#endif  // ESQ_OUTPUTHANDLERIMPL_HPP
