#ifndef DISPATCHER_SESSION_HPP
#define DISPATCHER_SESSION_HPP

#include <atomic>
#include <chrono>
#include <dispatcher/logging.hpp>
#include <dispatcher/types.hpp>
#include <dispatcher/workdir.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dispatcher
{

namespace subprocess
{
class Process;
class ReadPipe;
class WritePipe;
class WakePipe;
} // namespace subprocess

namespace internal
{
class StreamForwarder;
}

enum class SessionState
{
    Init,
    Routing,
    Spawning,
    Forwarding,
    ClosingClean,
    ClosingError,
    Terminated
};

enum class SessionOutcome
{
    Clean,         // Backend exited 0, caller closed first, or interrupted
    SpawnFailed,   // Backend not found / not executable / refused
    StreamFailed,  // I/O failure while relaying
    BackendFailed  // Backend exited nonzero or by signal
};

const char* to_string(SessionState state);
const char* to_string(SessionOutcome outcome);

/// Process exit status for the proxy: 0, 69 (EX_UNAVAILABLE), 74 (EX_IOERR), 70 (EX_SOFTWARE)
int exit_code_for(SessionOutcome outcome);

struct SessionOptions
{
    /// Explicit working directory (highest precedence)
    std::optional<std::string> workdir;

    /// Override variables consulted before the process current directory
    std::vector<std::string> workdir_env = default_workdir_variables();

    /// Environment inherited by the backend; captured from this process when unset
    std::optional<Environment> environment;

    /// Wait between shutdown escalation steps (close stdin, SIGTERM, SIGKILL)
    std::chrono::milliseconds grace_period{2000};

    /// When non-empty, the resolved backend executable must be one of these
    std::vector<std::string> allowed_commands;

    /// Caller-facing descriptors. The session takes ownership and closes them.
    int caller_input_fd = 0;
    int caller_output_fd = 1;

    /// Read buffer per forwarding direction
    size_t buffer_size = 64 * 1024;
};

struct SessionResult
{
    SessionOutcome outcome = SessionOutcome::Clean;
    SessionState final_state = SessionState::Init;
    WorkdirHint workdir;
    std::optional<ServerSpec> target;
    std::optional<ExitStatus> exit_status; // Set once the backend was reaped
    std::string error;                     // Empty for clean sessions
    size_t bytes_to_backend = 0;
    size_t bytes_from_backend = 0;

    int exit_code() const
    {
        return exit_code_for(outcome);
    }

    /// Throw the DispatcherError matching a failed outcome (SpawnError,
    /// StreamError or ChildExitError). Does nothing for a clean session.
    void raise_for_outcome() const;
};

/**
 * One routing-plus-forwarding lifecycle for a single caller connection.
 *
 * INIT -> ROUTING -> SPAWNING -> FORWARDING -> CLOSING_CLEAN | CLOSING_ERROR -> TERMINATED
 *
 * The route table is copied at construction and never re-read. The session
 * exclusively owns the backend process: every path out of run() leaves it
 * reaped and all relayed descriptors closed.
 */
class Session
{
  public:
    Session(RouteTable routes, SessionOptions options = {}, Logger logger = Logger{});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Run to completion. May only be called once.
    SessionResult run();

    /// Request shutdown. Async-signal-safe.
    void interrupt() noexcept;

    SessionState state() const noexcept
    {
        return state_.load();
    }

  private:
    void transition(SessionState next);
    void spawn_backend(const ServerSpec& target, const WorkdirHint& hint,
                       const Environment& inherited);
    SessionOutcome supervise(std::string& error);
    SessionOutcome classify_exit(const ExitStatus& status, std::string& error) const;
    void wait_for_event();
    void release(SessionResult& result);

    const RouteTable routes_;
    SessionOptions options_;
    Logger logger_;

    std::atomic<SessionState> state_{SessionState::Init};
    std::atomic<bool> interrupted_{false};
    bool started_ = false;

    // Adopted before the wake pipes are created
    std::unique_ptr<subprocess::ReadPipe> caller_in_;
    std::unique_ptr<subprocess::WritePipe> caller_out_;
    std::unique_ptr<subprocess::WakePipe> events_;
    std::unique_ptr<subprocess::WakePipe> interrupt_;

    // Declared before forwarder_ so the forwarder (which borrows the child's
    // pipes) is destroyed first
    std::unique_ptr<subprocess::Process> child_;
    std::unique_ptr<internal::StreamForwarder> forwarder_;
};

} // namespace dispatcher

#endif // DISPATCHER_SESSION_HPP
