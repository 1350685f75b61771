#ifndef DISPATCHER_TYPES_HPP
#define DISPATCHER_TYPES_HPP

#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dispatcher
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// Environment block as NAME -> VALUE
using Environment = std::map<std::string, std::string>;

// ============================================================================
// Route table
// ============================================================================

/// Backend server definition
struct ServerSpec
{
    std::string name;              // Required
    std::string command;           // Required, non-empty
    std::vector<std::string> args; // Required (may be empty)
    Environment env;               // Optional overrides on top of the inherited environment
    std::string description;       // Optional, display only
    std::optional<std::string> cwd = std::nullopt;    // Optional working directory for the backend
    std::optional<std::string> sha256 = std::nullopt; // Optional integrity pin for the executable

    /// Command and arguments joined with spaces (for display and error messages)
    std::string command_line() const;

    /// Convert to the "mcp_server" JSON object used in the configuration file
    json to_json() const;

    /// Create from a validated "mcp_server" JSON object
    static ServerSpec from_json(const json& j);

    bool operator==(const ServerSpec& other) const;
    bool operator!=(const ServerSpec& other) const
    {
        return !(*this == other);
    }
};

/// Glob pattern -> backend
struct RouteRule
{
    std::string pattern;
    ServerSpec target;
};

/// Ordered rules plus the fallback server. Order decides ties, not specificity.
struct RouteTable
{
    std::vector<RouteRule> rules;
    ServerSpec default_server;
};

// ============================================================================
// Process exit status
// ============================================================================

struct ExitStatus
{
    int code = -1;  // Exit code when the process exited normally
    int signal = 0; // Terminating signal, 0 when the process exited normally
    bool lost = false; // The child was reaped but its status could not be collected

    bool signaled() const
    {
        return signal != 0;
    }

    bool success() const
    {
        return !lost && !signaled() && code == 0;
    }

    /// Shell-style status: the exit code, or 128 + signal
    int shell_code() const
    {
        return signaled() ? 128 + signal : code;
    }

    /// "exit code 3" / "signal 9 (Killed)"
    std::string describe() const;
};

} // namespace dispatcher

#endif // DISPATCHER_TYPES_HPP
