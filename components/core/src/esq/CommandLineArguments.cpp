#include "CommandLineArguments.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

#include "Config.hpp"
#include "Defs.hpp"
#include "version.hpp"

namespace po = boost::program_options;

namespace esq {
namespace {
constexpr char cCatCommandName[] = "cat";

auto parse_log_level(std::string const& name) -> std::optional<spdlog::level::level_enum> {
    auto const level = spdlog::level::from_str(name);
    if (spdlog::level::off == level && "off" != name) {
        return std::nullopt;
    }
    return level;
}

auto get_general_options(std::string& config_path, std::string& log_level)
        -> po::options_description {
    po::options_description general_options("General Options");
    // clang-format off
    general_options.add_options()
            ("help,h", "Print help")
            ("version,V", "Print version")
            ("config", po::value<std::string>(&config_path)->value_name("FILE"),
             "Config file to read the connection settings from")
            ("log-level",
             po::value<std::string>(&log_level)->value_name("LEVEL")->default_value(log_level),
             "Diagnostics verbosity: trace, debug, info, warn, error or off");
    // clang-format on
    return general_options;
}

/**
 * Parses a count option as a signed number so that negative values are rejected rather than
 * wrapped around.
 * @param option_name
 * @param target
 * @return The value semantic storing the count into `target`
 */
auto count_value(char const* option_name, uint32_t& target) -> po::typed_value<int64_t>* {
    return po::value<int64_t>()
            ->default_value(target)
            ->notifier([option_name, &target](int64_t value) {
                if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
                    throw std::invalid_argument(fmt::format(
                            "--{} must be between 0 and {}.",
                            option_name,
                            std::numeric_limits<uint32_t>::max()
                    ));
                }
                target = static_cast<uint32_t>(value);
            });
}

auto get_cat_options_description(
        CatOptions& options,
        std::optional<std::string>& around,
        std::optional<std::string>& from,
        std::optional<std::string>& to,
        std::optional<std::string>& select_clause,
        std::optional<std::string>& where_clause
) -> po::options_description {
    auto const store_into = [](std::optional<std::string>& target) {
        return po::value<std::string>()->notifier([&target](std::string const& value) {
            target = value;
        });
    };

    po::options_description cat_options("Cat Options");
    // clang-format off
    cat_options.add_options()
            ("around,a", store_into(around)->value_name("DATETIME"),
             "Print documents around this point in time")
            ("lines,n", count_value("lines", options.parameters.num_lines)->value_name("N"),
             "Number of documents to print")
            ("from,F", store_into(from)->value_name("DATETIME"),
             "Print documents at or after this point in time")
            ("to,T", store_into(to)->value_name("DATETIME"),
             "Print documents before this point in time")
            ("select,s", store_into(select_clause)->value_name("FIELDS"),
             "Comma-separated fields of each document to print")
            ("where,w", store_into(where_clause)->value_name("FILTERS"),
             "Comma-separated field:value pairs that documents must match")
            ("follow,f", po::bool_switch(&options.parameters.follow),
             "Keep printing documents as they are indexed")
            ("retries",
             count_value("retries", options.paginator_options.max_retries)->value_name("N"),
             "Consecutive transient failures to retry while following")
            ("batch-size",
             count_value("batch-size", options.paginator_options.batch_size)->value_name("N"),
             "Number of documents requested per search");
    // clang-format on
    return cat_options;
}
}  // namespace

auto CommandLineArguments::parse_arguments(int argc, char const** argv) -> ParsingResult {
    if (1 == argc) {
        print_basic_usage();
        return ParsingResult::Failure;
    }

    try {
        std::string config_path;
        std::string log_level{"warn"};
        auto general_options = get_general_options(config_path, log_level);

        std::string command_input;
        po::options_description general_positional_options;
        // clang-format off
        general_positional_options.add_options()
                ("command", po::value<std::string>(&command_input))
                ("command-args", po::value<std::vector<std::string>>());
        // clang-format on
        po::positional_options_description general_positional_options_description;
        general_positional_options_description.add("command", 1);
        general_positional_options_description.add("command-args", -1);

        po::options_description all_descriptions;
        all_descriptions.add(general_options);
        all_descriptions.add(general_positional_options);

        po::parsed_options parsed = po::command_line_parser(argc, argv)
                                            .options(all_descriptions)
                                            .positional(general_positional_options_description)
                                            .allow_unregistered()
                                            .run();
        po::variables_map parsed_command_line_options;
        po::store(parsed, parsed_command_line_options);
        po::notify(parsed_command_line_options);

        if (parsed_command_line_options.count("version")) {
            std::cout << m_program_name << " " << cVersion << std::endl;
            return ParsingResult::InfoCommand;
        }

        bool const help_requested = 0 != parsed_command_line_options.count("help");
        if (command_input.empty()) {
            if (help_requested) {
                print_basic_usage();
                std::cerr << std::endl;
                std::cerr << "Commands:" << std::endl;
                std::cerr << "  cat  Print the documents of an index" << std::endl;
                std::cerr << std::endl;
                std::cerr << general_options << std::endl;
                return ParsingResult::InfoCommand;
            }
            throw std::invalid_argument("Command unspecified.");
        }
        if (cCatCommandName != command_input) {
            throw std::invalid_argument(fmt::format("Unknown command '{}'.", command_input));
        }
        m_command = Command::Cat;

        auto const parsed_log_level = parse_log_level(log_level);
        if (false == parsed_log_level.has_value()) {
            throw std::invalid_argument(fmt::format("Invalid log level '{}'.", log_level));
        }
        m_log_level = parsed_log_level.value();
        m_config_path = config_path.empty() ? get_default_config_path()
                                            : std::filesystem::path{config_path};

        // Everything after the command, in the order it was given
        std::vector<std::string> unrecognized_options
                = po::collect_unrecognized(parsed.options, po::include_positional);
        unrecognized_options.erase(unrecognized_options.begin());
        return parse_cat_arguments(unrecognized_options, help_requested);
    } catch (std::exception& e) {
        SPDLOG_ERROR("{}", e.what());
        print_basic_usage();
        std::cerr << "Try " << m_program_name << " --help for detailed usage instructions"
                  << std::endl;
        return ParsingResult::Failure;
    }
}

auto CommandLineArguments::parse_cat_arguments(
        std::vector<std::string> const& arguments,
        bool help_requested
) -> ParsingResult {
    CatOptions options;
    std::optional<std::string> around;
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::string> select_clause;
    std::optional<std::string> where_clause;
    auto cat_options
            = get_cat_options_description(options, around, from, to, select_clause, where_clause);

    po::options_description cat_positional_options;
    // clang-format off
    cat_positional_options.add_options()
            ("index", po::value<std::string>(&options.index));
    // clang-format on
    po::positional_options_description cat_positional_options_description;
    cat_positional_options_description.add("index", 1);

    po::options_description all_cat_options;
    all_cat_options.add(cat_options);
    all_cat_options.add(cat_positional_options);

    po::variables_map parsed_command_line_options;
    po::store(
            po::command_line_parser(arguments)
                    .options(all_cat_options)
                    .positional(cat_positional_options_description)
                    .run(),
            parsed_command_line_options
    );
    po::notify(parsed_command_line_options);

    if (help_requested) {
        print_cat_usage();
        std::cerr << std::endl;
        std::cerr << "Examples:" << std::endl;
        std::cerr << "  # Print the last 10 documents of an index" << std::endl;
        std::cerr << "  " << m_program_name << " cat logs-app" << std::endl;
        std::cerr << "  # Print 20 documents around a point in time" << std::endl;
        std::cerr << "  " << m_program_name << " cat logs-app --around \"2024-01-01 12:00\" -n 20"
                  << std::endl;
        std::cerr << "  # Follow new documents matching a filter" << std::endl;
        std::cerr << "  " << m_program_name << " cat logs-app -f -w level:error" << std::endl;
        std::cerr << std::endl;
        std::cerr << cat_options << std::endl;
        return ParsingResult::InfoCommand;
    }

    if (options.index.empty()) {
        throw std::invalid_argument("Index unspecified.");
    }
    if (0 == options.paginator_options.batch_size
        || options.paginator_options.batch_size > cMaxBatchSize)
    {
        throw std::invalid_argument(
                fmt::format("--batch-size must be between 1 and {}.", cMaxBatchSize)
        );
    }
    if (options.paginator_options.max_retries > 0 && false == options.parameters.follow) {
        SPDLOG_WARN("--retries only applies together with --follow.");
    }

    options.parameters.around = std::move(around);
    options.parameters.from = std::move(from);
    options.parameters.to = std::move(to);
    options.parameters.select_clause = std::move(select_clause);
    options.parameters.where_clause = std::move(where_clause);
    m_cat_options = std::move(options);
    return ParsingResult::Success;
}

void CommandLineArguments::print_basic_usage() const {
    std::cerr << "Usage: " << m_program_name << " [OPTIONS] COMMAND [COMMAND ARGUMENTS]"
              << std::endl;
}

void CommandLineArguments::print_cat_usage() const {
    std::cerr << "Usage: " << m_program_name << " [OPTIONS] cat INDEX [CAT OPTIONS]" << std::endl;
}
}  // namespace esq
