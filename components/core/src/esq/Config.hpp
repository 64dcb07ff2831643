#ifndef ESQ_CONFIG_HPP
#define ESQ_CONFIG_HPP

#include <filesystem>
#include <istream>
#include <optional>
#include <string>

#include "ErrorCategory.hpp"
#include "http/HttpClient.hpp"

namespace esq {
constexpr char cUrlEnvVar[] = "ESQ_URL";
constexpr char cUsernameEnvVar[] = "ESQ_USERNAME";
constexpr char cPasswordEnvVar[] = "ESQ_PASSWORD";

/**
 * Connection settings of the search service.
 */
struct Config {
    std::string url;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

/**
 * @param config
 * @return Credentials for basic auth if both a username and a password are configured
 */
[[nodiscard]] auto get_basic_auth(Config const& config) -> std::optional<http::BasicAuth>;

/**
 * @return "$HOME/.esq/config.toml", or a path relative to the working directory if HOME isn't
 * set
 */
[[nodiscard]] auto get_default_config_path() -> std::filesystem::path;

/**
 * Reads the `[default]` section of a TOML-style config. Values may be quoted; unknown keys and
 * sections are ignored. Neither environment overrides nor validation are applied.
 * @param input
 * @return A result containing the settings on success, or an error code indicating the failure:
 * - ErrorCodeEnum::ConfigFailure if the input isn't valid config syntax.
 */
[[nodiscard]] auto parse_config(std::istream& input) -> Result<Config>;

/**
 * Loads the config file at `path`, if it exists, then applies the ESQ_URL, ESQ_USERNAME and
 * ESQ_PASSWORD environment variables on top of it.
 * @param path
 * @return A result containing the settings on success, or an error code indicating the failure:
 * - ErrorCodeEnum::ConfigFailure if the file can't be read or parsed, or no url is configured.
 */
[[nodiscard]] auto load_config(std::filesystem::path const& path) -> Result<Config>;
}  // namespace esq

#endif  // ESQ_CONFIG_HPP
