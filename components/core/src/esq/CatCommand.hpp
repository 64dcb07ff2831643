#ifndef ESQ_CATCOMMAND_HPP
#define ESQ_CATCOMMAND_HPP

#include <string>

#include "Config.hpp"
#include "ErrorCategory.hpp"
#include "ExtractionPlan.hpp"
#include "http/HttpClient.hpp"
#include "search/BatchPaginator.hpp"
#include "search/OutputHandler.hpp"

namespace esq {
struct CatOptions {
    std::string index;
    ExtractionParameters parameters;
    search::PaginatorOptions paginator_options;
};

/**
 * Prints the documents of an index selected by the given time options, oldest first. The
 * point-in-time opened for the extraction, if any, is closed before returning, whatever the
 * outcome.
 * @param http_client
 * @param config
 * @param options
 * @param output_handler
 * @return A void result on success, or an error code indicating the failure:
 * - ErrorCodeEnum::ValidationFailure if the options are invalid. Nothing is sent in that case.
 * - ErrorCodeEnum::DateParseFailure if a date option can't be parsed. Nothing is sent in that
 *   case.
 * - ErrorCodeEnum::Interrupted if a bounded extraction was interrupted. An interrupted follow
 *   extraction is a success.
 * - Forwards SnapshotManager::open's and BatchPaginator::run's return values on failure.
 */
[[nodiscard]] auto run_cat_command(
        http::HttpClient& http_client,
        Config const& config,
        CatOptions const& options,
        search::OutputHandler& output_handler
) -> Result<void>;
}  // namespace esq

#endif  // ESQ_CATCOMMAND_HPP
