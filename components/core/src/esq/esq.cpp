#include <exception>
#include <memory>

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "CatCommand.hpp"
#include "CommandLineArguments.hpp"
#include "Config.hpp"
#include "ErrorCategory.hpp"
#include "Interrupt.hpp"
#include "OutputHandlerImpl.hpp"
#include "http/CurlGlobalInstance.hpp"
#include "http/CurlHttpClient.hpp"

using esq::CommandLineArguments;
using esq::ErrorCodeEnum;

namespace {
// Conventional exit status of a process stopped by SIGINT
constexpr int cInterruptedExitCode = 130;

/**
 * Runs the cat command described by the command line arguments.
 * @param command_line_arguments
 * @return The process's exit code
 */
auto run_cat(CommandLineArguments const& command_line_arguments) -> int {
    auto const config = esq::load_config(command_line_arguments.get_config_path());
    if (config.has_error()) {
        SPDLOG_ERROR("Error: {}", config.error().message());
        return 1;
    }

    esq::install_interrupt_handlers();

    esq::http::CurlGlobalInstance const curl_instance{};
    esq::http::CurlHttpClient http_client{esq::get_basic_auth(config.value())};
    esq::StandardOutputHandler output_handler;

    auto const result = esq::run_cat_command(
            http_client,
            config.value(),
            command_line_arguments.get_cat_options(),
            output_handler
    );
    if (result.has_error()) {
        if (ErrorCodeEnum::Interrupted == result.error()) {
            return cInterruptedExitCode;
        }
        SPDLOG_ERROR("Error: {}", result.error().message());
        return 1;
    }
    return 0;
}
}  // namespace

int main(int argc, char const* argv[]) {
    try {
        auto stderr_logger = spdlog::stderr_logger_st("stderr");
        spdlog::set_default_logger(stderr_logger);
        spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%l] %v");
    } catch (std::exception& e) {
        // NOTE: We can't log an exception if the logger couldn't be constructed
        return 1;
    }

    CommandLineArguments command_line_arguments("esq");
    auto parsing_result = command_line_arguments.parse_arguments(argc, argv);
    switch (parsing_result) {
        case CommandLineArguments::ParsingResult::Failure:
            return 1;
        case CommandLineArguments::ParsingResult::InfoCommand:
            return 0;
        case CommandLineArguments::ParsingResult::Success:
            // Continue processing
            break;
    }
    spdlog::set_level(command_line_arguments.get_log_level());

    try {
        switch (command_line_arguments.get_command()) {
            case CommandLineArguments::Command::Cat:
                return run_cat(command_line_arguments);
        }
    } catch (std::exception const& e) {
        SPDLOG_ERROR("Encountered error during extraction - {}", e.what());
        return 1;
    }
    return 1;
}
