#ifndef DISPATCHER_CONFIG_HPP
#define DISPATCHER_CONFIG_HPP

#include <chrono>
#include <dispatcher/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dispatcher
{

// Environment variable naming the configuration file
constexpr const char* CONFIG_ENV_VAR = "MCP_DISPATCHER_CONFIG";

// Default grace period between shutdown escalation steps
constexpr std::chrono::milliseconds DEFAULT_GRACE_PERIOD{2000};

// Largest accepted grace_period_ms (one hour)
constexpr std::chrono::milliseconds MAX_GRACE_PERIOD{3600 * 1000};

/// Fully resolved configuration handed to the core
struct DispatcherConfig
{
    RouteTable routes;
    std::optional<std::string> log_level;        // "debug", "info", ...
    std::vector<std::string> workdir_env;        // Empty means default_workdir_variables()
    std::chrono::milliseconds grace_period = DEFAULT_GRACE_PERIOD;
    std::vector<std::string> allowed_commands;   // Empty means no allowlist
};

/**
 * Locate the configuration file.
 *
 * Priority: explicit path, MCP_DISPATCHER_CONFIG, ./config.json when present,
 * then the platform default (see default_config_path). The returned path may
 * not exist.
 */
std::string find_config_file(const std::optional<std::string>& explicit_path,
                             const Environment& env);

/// $XDG_CONFIG_HOME/mcp_dispatcher/config.json, ~/.config/... or the macOS
/// Application Support equivalent
std::string default_config_path(const Environment& env);

/// Every problem found in a configuration document (empty when valid)
std::vector<std::string> validate_config(const json& j);

/// Validate and convert. Throws ConfigurationError listing all problems.
DispatcherConfig parse_config(const json& j);

/// Read and parse a configuration file. Throws ConfigurationError.
DispatcherConfig load_config(const std::string& path);

/// Raw JSON document (for edits that must preserve unknown keys)
json read_config_json(const std::string& path);

/// Write indented JSON, creating parent directories. Throws ConfigurationError.
void write_config_json(const std::string& path, const json& j);

/// Append a mapping to a configuration document
void add_path_mapping(json& config, const std::string& pattern, const ServerSpec& server);

/// Remove mappings with exactly this pattern. Returns the number removed.
size_t remove_path_mapping(json& config, const std::string& pattern);

/// Actionable text for a missing configuration file
std::string missing_config_help(const std::string& expected_path);

} // namespace dispatcher

#endif // DISPATCHER_CONFIG_HPP
