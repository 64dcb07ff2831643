#include "CatCommand.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <system_error>

#include <boost/outcome/success_failure.hpp>
#include <spdlog/spdlog.h>

#include "DateParser.hpp"
#include "ErrorCategory.hpp"
#include "ExtractionPlan.hpp"
#include "search/AnchorResolver.hpp"
#include "search/BatchPaginator.hpp"
#include "search/Defs.hpp"
#include "search/SearchClient.hpp"
#include "search/SnapshotManager.hpp"

namespace esq {
namespace {
/**
 * Rejects unparseable dates before anything is sent to the service.
 * @param name
 * @param value
 * @param now
 * @return Whether `value` is absent or parses
 */
auto validate_date(char const* name, std::optional<std::string> const& value, Timestamp now)
        -> bool {
    if (false == value.has_value()) {
        return true;
    }
    if (false == parse_datetime(value.value(), now).has_value()) {
        SPDLOG_ERROR("Failed to parse --{} date '{}'", name, value.value());
        return false;
    }
    return true;
}

/**
 * @param plan
 * @param error
 * @return `error`, unless it is an interrupt ending a follow extraction, which is its normal way
 * of stopping
 */
auto handle_extraction_failure(ExtractionPlan const& plan, std::error_code const& error)
        -> Result<void> {
    if (ErrorCodeEnum::Interrupted == error && plan.poll_between_batches) {
        SPDLOG_DEBUG("Stopped following");
        return boost::outcome_v2::success();
    }
    return error;
}
}  // namespace

auto run_cat_command(
        http::HttpClient& http_client,
        Config const& config,
        CatOptions const& options,
        search::OutputHandler& output_handler
) -> Result<void> {
    auto const plan_result = resolve_extraction_plan(options.parameters);
    if (plan_result.has_error()) {
        return plan_result.error();
    }
    auto const& plan = plan_result.value();

    auto const now = std::chrono::time_point_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now()
    );
    auto const& parameters = options.parameters;
    if (false == validate_date("around", parameters.around, now)
        || false == validate_date("from", parameters.from, now)
        || false == validate_date("to", parameters.to, now))
    {
        return make_error_code(ErrorCodeEnum::DateParseFailure);
    }

    search::SearchClient client{http_client, config.url, options.index};
    search::SnapshotManager snapshot_manager{client};
    if (plan.needs_snapshot) {
        auto const opened = snapshot_manager.open();
        if (opened.has_error()) {
            return handle_extraction_failure(plan, opened.error());
        }
    }

    auto const cursor
            = search::resolve_anchor(client, plan, snapshot_manager.get_session(), now);
    if (cursor.has_error()) {
        return handle_extraction_failure(plan, cursor.error());
    }

    search::BatchPaginator paginator{
            client,
            plan,
            plan.needs_snapshot ? &snapshot_manager : nullptr,
            output_handler,
            options.paginator_options
    };
    auto const result = paginator.run(paginator.initial_state(cursor.value()));
    if (result.has_error()) {
        return handle_extraction_failure(plan, result.error());
    }
    return boost::outcome_v2::success();
}
}  // namespace esq
