#ifndef ESQ_COMMANDLINEARGUMENTS_HPP
#define ESQ_COMMANDLINEARGUMENTS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/common.h>

#include "CatCommand.hpp"

namespace esq {
class CommandLineArguments {
public:
    // Types
    enum class ParsingResult : uint8_t {
        Success = 0,
        InfoCommand,
        Failure
    };

    enum class Command : uint8_t {
        Cat = 0
    };

    // Constructors
    explicit CommandLineArguments(std::string program_name)
            : m_program_name{std::move(program_name)} {}

    // Methods
    [[nodiscard]] auto parse_arguments(int argc, char const** argv) -> ParsingResult;

    [[nodiscard]] auto get_program_name() const -> std::string const& { return m_program_name; }

    [[nodiscard]] auto get_command() const -> Command { return m_command; }

    [[nodiscard]] auto get_config_path() const -> std::filesystem::path const& {
        return m_config_path;
    }

    [[nodiscard]] auto get_log_level() const -> spdlog::level::level_enum { return m_log_level; }

    [[nodiscard]] auto get_cat_options() const -> CatOptions const& { return m_cat_options; }

private:
    // Methods
    /**
     * @param arguments Tokens following the "cat" command
     * @param help_requested
     * @return The parsing result
     * @throw boost::program_options::error if the arguments are malformed
     */
    auto parse_cat_arguments(std::vector<std::string> const& arguments, bool help_requested)
            -> ParsingResult;

    void print_basic_usage() const;

    void print_cat_usage() const;

    // Variables
    std::string m_program_name;
    Command m_command{Command::Cat};
    std::filesystem::path m_config_path;
    spdlog::level::level_enum m_log_level{spdlog::level::warn};
    CatOptions m_cat_options;
};
}  // namespace esq

#endif  // ESQ_COMMANDLINEARGUMENTS_HPP
