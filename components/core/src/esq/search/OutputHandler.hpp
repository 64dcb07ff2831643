#ifndef ESQ_SEARCH_OUTPUTHANDLER_HPP
#define ESQ_SEARCH_OUTPUTHANDLER_HPP

#include <nlohmann/json.hpp>

#include "../ErrorCode.hpp"

namespace esq::search {
/**
 * Abstract class for handling the documents read from the service.
 */
class OutputHandler {
public:
    // Destructor
    virtual ~OutputHandler() = default;

    // Methods
    /**
     * Writes one document.
     * @param document
     */
    virtual void write(nlohmann::json const& document) = 0;

    /**
     * Flushes whatever was written since the last flush. Called after every batch.
     * @return ErrorCode_Success on success or relevant error code on error
     */
    virtual auto flush() -> ErrorCode = 0;
};
}  // namespace esq::search

#endif  // ESQ_SEARCH_OUTPUTHANDLER_HPP
