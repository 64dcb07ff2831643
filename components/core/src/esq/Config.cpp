#include "Config.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include "ErrorCategory.hpp"

namespace po = boost::program_options;

namespace esq {
namespace {
constexpr char cConfigDirName[] = ".esq";
constexpr char cConfigFileName[] = "config.toml";

/**
 * Appends the UTF-8 encoding of a code point.
 * @param code_point
 * @param output
 * @return Whether the code point is a valid Unicode scalar value
 */
auto append_utf8(uint32_t code_point, std::string& output) -> bool {
    if ((code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
        return false;
    }
    if (code_point < 0x80) {
        output += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        output += static_cast<char>(0xC0 | (code_point >> 6));
        output += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        output += static_cast<char>(0xE0 | (code_point >> 12));
        output += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        output += static_cast<char>(0xF0 | (code_point >> 18));
        output += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (code_point & 0x3F));
    }
    return true;
}

/**
 * Decodes the escape sequences of a TOML basic string's contents.
 * @param contents
 * @return The decoded string, or std::nullopt if an escape sequence is invalid
 */
auto decode_basic_string(std::string_view contents) -> std::optional<std::string> {
    std::string decoded;
    decoded.reserve(contents.size());
    for (size_t i = 0; i < contents.size(); ++i) {
        if ('\\' != contents[i]) {
            decoded += contents[i];
            continue;
        }
        if (++i == contents.size()) {
            return std::nullopt;
        }
        switch (contents[i]) {
            case '"':
            case '\\':
                decoded += contents[i];
                break;
            case 'b':
                decoded += '\b';
                break;
            case 't':
                decoded += '\t';
                break;
            case 'n':
                decoded += '\n';
                break;
            case 'f':
                decoded += '\f';
                break;
            case 'r':
                decoded += '\r';
                break;
            case 'u':
            case 'U': {
                size_t const num_digits = 'u' == contents[i] ? 4 : 8;
                if (contents.size() - i - 1 < num_digits) {
                    return std::nullopt;
                }
                auto const* begin = contents.data() + i + 1;
                uint32_t code_point{0};
                auto const [ptr, ec] = std::from_chars(begin, begin + num_digits, code_point, 16);
                if (std::errc{} != ec || begin + num_digits != ptr
                    || false == append_utf8(code_point, decoded))
                {
                    return std::nullopt;
                }
                i += num_digits;
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return decoded;
}

/**
 * Strips the quotes around a value. Escape sequences are decoded in double-quoted (basic) strings
 * and kept verbatim in single-quoted (literal) strings.
 * @param value
 * @return The value
 * @throw po::invalid_config_file_syntax if a basic string contains an invalid escape sequence
 */
auto unquote(std::string value) -> std::string {
    boost::algorithm::trim(value);
    if (value.size() < 2) {
        return value;
    }
    if ('\'' == value.front() && '\'' == value.back()) {
        return value.substr(1, value.size() - 2);
    }
    if ('"' == value.front() && '"' == value.back()) {
        auto decoded = decode_basic_string(std::string_view{value}.substr(1, value.size() - 2));
        if (false == decoded.has_value()) {
            throw po::invalid_config_file_syntax(value, po::invalid_syntax::unrecognized_line);
        }
        return std::move(decoded.value());
    }
    return value;
}

auto get_env(char const* name) -> std::optional<std::string> {
    auto const* value = std::getenv(name);
    if (nullptr == value || '\0' == *value) {
        return std::nullopt;
    }
    return std::string{value};
}

auto get_optional_setting(po::variables_map const& parsed_options, char const* name)
        -> std::optional<std::string> {
    if (0 == parsed_options.count(name)) {
        return std::nullopt;
    }
    auto value = unquote(parsed_options[name].as<std::string>());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}
}  // namespace

auto get_basic_auth(Config const& config) -> std::optional<http::BasicAuth> {
    if (false == config.username.has_value() || false == config.password.has_value()) {
        return std::nullopt;
    }
    return http::BasicAuth{config.username.value(), config.password.value()};
}

auto get_default_config_path() -> std::filesystem::path {
    auto const home = get_env("HOME");
    std::filesystem::path path{home.value_or(".")};
    return path / cConfigDirName / cConfigFileName;
}

auto parse_config(std::istream& input) -> Result<Config> {
    // clang-format off
    po::options_description config_options;
    config_options.add_options()
            ("default.url", po::value<std::string>())
            ("default.username", po::value<std::string>())
            ("default.password", po::value<std::string>());
    // clang-format on

    po::variables_map parsed_options;
    Config config;
    try {
        po::store(po::parse_config_file(input, config_options, true), parsed_options);
        po::notify(parsed_options);

        config.url = get_optional_setting(parsed_options, "default.url").value_or("");
        config.username = get_optional_setting(parsed_options, "default.username");
        config.password = get_optional_setting(parsed_options, "default.password");
    } catch (po::error const& e) {
        SPDLOG_ERROR("Failed to parse config - {}", e.what());
        return make_error_code(ErrorCodeEnum::ConfigFailure);
    }
    return config;
}

auto load_config(std::filesystem::path const& path) -> Result<Config> {
    Config config;
    std::error_code error_code;
    if (std::filesystem::exists(path, error_code)) {
        std::ifstream config_file{path};
        if (false == config_file.is_open()) {
            SPDLOG_ERROR("Failed to open config file {}", path.string());
            return make_error_code(ErrorCodeEnum::ConfigFailure);
        }
        auto parsed = parse_config(config_file);
        if (parsed.has_error()) {
            return parsed.error();
        }
        config = std::move(parsed.value());
        SPDLOG_DEBUG("Loaded config from {}", path.string());
    }

    if (auto url = get_env(cUrlEnvVar); url.has_value()) {
        config.url = std::move(url.value());
    }
    if (auto username = get_env(cUsernameEnvVar); username.has_value()) {
        config.username = std::move(username);
    }
    if (auto password = get_env(cPasswordEnvVar); password.has_value()) {
        config.password = std::move(password);
    }

    while (false == config.url.empty() && '/' == config.url.back()) {
        config.url.pop_back();
    }
    if (config.url.empty()) {
        SPDLOG_ERROR("No configuration found. Please login first.");
        return make_error_code(ErrorCodeEnum::ConfigFailure);
    }
    return config;
}
}  // namespace esq
