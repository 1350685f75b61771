#ifndef DISPATCHER_WORKDIR_HPP
#define DISPATCHER_WORKDIR_HPP

#include <dispatcher/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dispatcher
{

// Exported to the backend alongside PWD
constexpr const char* WORKDIR_ENV_VAR = "MCP_DISPATCHER_CWD";

enum class WorkdirSource
{
    Explicit,    // Supplied on the command line
    Environment, // Override variable set by the invoking client
    ProcessCwd   // The proxy's own current directory (fallback only)
};

const char* to_string(WorkdirSource source);

/// Working-directory hint used as the routing key and exported to the backend
struct WorkdirHint
{
    std::string path;
    WorkdirSource source = WorkdirSource::ProcessCwd;
    std::string variable; // Variable that supplied the path (Environment source only)
};

/// MCP_DISPATCHER_CWD, then PWD
const std::vector<std::string>& default_workdir_variables();

/// Snapshot of the current process environment
Environment capture_environment();

/**
 * Source the working-directory hint.
 *
 * Precedence: a non-empty explicit value, then the first non-empty variable of
 * override_vars in env, then the process current directory. A proxy's own
 * current directory is not reliably the caller's, so it is only consulted when
 * no override is present. Relative values are made absolute against the
 * process current directory.
 */
WorkdirHint resolve_workdir_hint(const std::optional<std::string>& explicit_dir,
                                 const Environment& env,
                                 const std::vector<std::string>& override_vars);

} // namespace dispatcher

#endif // DISPATCHER_WORKDIR_HPP
