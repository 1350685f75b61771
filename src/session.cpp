#include "internal/forwarding/stream_forwarder.hpp"
#include "internal/subprocess/process.hpp"
#include "internal/verification/executable_verification.hpp"

#include <cerrno>
#include <fcntl.h>
#include <dispatcher/errors.hpp>
#include <dispatcher/router.hpp>
#include <dispatcher/session.hpp>
#include <poll.h>
#include <stdexcept>
#include <system_error>

namespace dispatcher
{

using internal::Direction;
using internal::LoopEnd;
using internal::LoopResult;

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Init:
        return "INIT";
    case SessionState::Routing:
        return "ROUTING";
    case SessionState::Spawning:
        return "SPAWNING";
    case SessionState::Forwarding:
        return "FORWARDING";
    case SessionState::ClosingClean:
        return "CLOSING_CLEAN";
    case SessionState::ClosingError:
        return "CLOSING_ERROR";
    case SessionState::Terminated:
        return "TERMINATED";
    }
    return "UNKNOWN";
}

const char* to_string(SessionOutcome outcome)
{
    switch (outcome)
    {
    case SessionOutcome::Clean:
        return "clean";
    case SessionOutcome::SpawnFailed:
        return "spawn failed";
    case SessionOutcome::StreamFailed:
        return "stream failed";
    case SessionOutcome::BackendFailed:
        return "backend failed";
    }
    return "unknown";
}

int exit_code_for(SessionOutcome outcome)
{
    switch (outcome)
    {
    case SessionOutcome::Clean:
        return 0;
    case SessionOutcome::SpawnFailed:
        return 69; // EX_UNAVAILABLE
    case SessionOutcome::StreamFailed:
        return 74; // EX_IOERR
    case SessionOutcome::BackendFailed:
        return 70; // EX_SOFTWARE
    }
    return 70;
}

void SessionResult::raise_for_outcome() const
{
    switch (outcome)
    {
    case SessionOutcome::Clean:
        return;
    case SessionOutcome::SpawnFailed:
        throw SpawnError(error, target ? target->command : std::string(),
                         target ? target->args : std::vector<std::string>{});
    case SessionOutcome::StreamFailed:
        throw StreamError(error);
    case SessionOutcome::BackendFailed:
        throw ChildExitError(error, exit_status ? exit_status->code : -1,
                             exit_status ? exit_status->signal : 0);
    }
}

namespace
{

// A closed caller descriptor would be handed out again by the next pipe2()
// and the session would end up relaying its own wake pipe
int require_open_fd(int fd, const char* what)
{
    if (fd < 0 || ::fcntl(fd, F_GETFD) == -1)
        throw StreamError(std::string("Caller ") + what + " descriptor " + std::to_string(fd) +
                          " is not open");
    return fd;
}

} // namespace

Session::Session(RouteTable routes, SessionOptions options, Logger logger)
    : routes_(std::move(routes)), options_(std::move(options)), logger_(std::move(logger)),
      caller_in_(std::make_unique<subprocess::ReadPipe>(
          subprocess::ReadPipe::adopt(require_open_fd(options_.caller_input_fd, "input")))),
      caller_out_(std::make_unique<subprocess::WritePipe>(
          subprocess::WritePipe::adopt(require_open_fd(options_.caller_output_fd, "output")))),
      events_(std::make_unique<subprocess::WakePipe>()),
      interrupt_(std::make_unique<subprocess::WakePipe>())
{
}

// Members are torn down forwarder first, then the child (killed and reaped if
// still running), then the caller descriptors
Session::~Session() = default;

void Session::interrupt() noexcept
{
    interrupted_.store(true);
    interrupt_->notify();
}

void Session::transition(SessionState next)
{
    logger_.debug(std::string("Session state ") + to_string(state_.load()) + " -> " +
                  to_string(next));
    state_.store(next);
}

SessionResult Session::run()
{
    if (started_)
        throw std::logic_error("Session::run may only be called once");
    started_ = true;

    SessionResult result;
    const Environment inherited =
        options_.environment ? *options_.environment : capture_environment();

    // Routing never fails
    transition(SessionState::Routing);
    result.workdir = resolve_workdir_hint(options_.workdir, inherited, options_.workdir_env);
    if (result.workdir.source == WorkdirSource::Environment)
        logger_.info("Working directory: " + result.workdir.path + " (from $" +
                     result.workdir.variable + ")");
    else
        logger_.info("Working directory: " + result.workdir.path + " (" +
                     to_string(result.workdir.source) + ")");

    RouteMatch match = explain(result.workdir.path, routes_);
    if (match.is_default())
        logger_.info("No path mapping matched, using default server '" + match.target.name +
                     "'");
    else
        logger_.info("Matched pattern '" + match.pattern + "' -> server '" + match.target.name +
                     "'");
    result.target = match.target;

    if (interrupted_.load())
    {
        logger_.info("Interrupted before the backend was started");
        transition(SessionState::ClosingClean);
        release(result);
        return result;
    }

    transition(SessionState::Spawning);
    try
    {
        spawn_backend(match.target, result.workdir, inherited);
    }
    catch (const SpawnError& e)
    {
        logger_.error(std::string("Failed to start MCP server '") + match.target.name +
                      "': " + e.what());
        result.outcome = SessionOutcome::SpawnFailed;
        result.error = e.what();
        transition(SessionState::ClosingError);
        release(result);
        return result;
    }

    transition(SessionState::Forwarding);
    try
    {
        forwarder_ = std::make_unique<internal::StreamForwarder>(
            *caller_in_, *caller_out_, child_->stdin_pipe(), child_->stdout_pipe(),
            options_.buffer_size);
        subprocess::WakePipe* events = events_.get();
        forwarder_->start([events](Direction, const LoopResult&) { events->notify(); });
    }
    catch (const std::system_error& e)
    {
        forwarder_.reset();
        logger_.error(std::string("Failed to start forwarding: ") + e.what());
        result.outcome = SessionOutcome::StreamFailed;
        result.error = e.what();
        transition(SessionState::ClosingError);
        release(result);
        return result;
    }

    std::string error;
    result.outcome = supervise(error);
    result.error = error;
    if (!error.empty())
        logger_.error(error);

    transition(result.outcome == SessionOutcome::Clean ? SessionState::ClosingClean
                                                       : SessionState::ClosingError);
    release(result);
    return result;
}

void Session::spawn_backend(const ServerSpec& target, const WorkdirHint& hint,
                            const Environment& inherited)
{
    Environment env = inherited;
    for (const auto& [key, value] : target.env)
        env[key] = value;
    env["PWD"] = hint.path;
    env[WORKDIR_ENV_VAR] = hint.path;

    std::optional<std::string> search_path;
    auto path_it = env.find("PATH");
    if (path_it != env.end())
        search_path = path_it->second;

    if (target.sha256 || !options_.allowed_commands.empty())
    {
        auto resolved = subprocess::find_executable(target.command, search_path);
        if (!resolved)
            throw SpawnError("Command not found: " + target.command, target.command, target.args,
                             ENOENT);

        if (!internal::verify_command_allowed(*resolved, options_.allowed_commands))
            throw SpawnError("Command '" + *resolved + "' is not listed in allowed_commands",
                             target.command, target.args, EACCES);

        std::string verify_error;
        if (!internal::verify_executable_hash(*resolved, target.sha256, verify_error))
            throw SpawnError(verify_error, target.command, target.args, EACCES);

        logger_.debug("Verified backend executable " + *resolved);
    }

    subprocess::ProcessOptions process_options;
    process_options.environment = std::move(env);
    process_options.inherit_environment = false;
    process_options.working_directory = target.cwd.value_or("");
    process_options.redirect_stdin = true;
    process_options.redirect_stdout = true;

    subprocess::WakePipe* events = events_.get();
    process_options.on_exit = [events](const ExitStatus&) { events->notify(); };

    logger_.info("Starting MCP server '" + target.name + "': " + target.command_line());

    auto child = std::make_unique<subprocess::Process>();
    child->spawn(target.command, target.args, process_options);
    child_ = std::move(child);

    logger_.debug("Backend pid " + std::to_string(child_->pid()));
}

SessionOutcome Session::supervise(std::string& error)
{
    while (true)
    {
        if (interrupted_.load())
        {
            logger_.info("Shutdown requested, stopping backend");
            return SessionOutcome::Clean;
        }

        auto upstream = forwarder_->result(Direction::CallerToChild);
        auto downstream = forwarder_->result(Direction::ChildToCaller);
        auto exited = child_->try_wait();

        if (downstream && downstream->failed())
        {
            error = std::string("Forwarding ") + internal::to_string(Direction::ChildToCaller) +
                    " " + internal::to_string(downstream->end) + ": " + downstream->error;
            return SessionOutcome::StreamFailed;
        }

        if (upstream)
        {
            switch (upstream->end)
            {
            case LoopEnd::EndOfStream:
                logger_.info("Client closed its input, stopping backend");
                return SessionOutcome::Clean;

            case LoopEnd::WriteFailed:
                // The backend closing its input usually means it is exiting;
                // its status is the better diagnosis
                if (!exited)
                    exited = child_->wait_for(options_.grace_period);
                if (exited)
                    return classify_exit(*exited, error);
                error = std::string("Forwarding ") +
                        internal::to_string(Direction::CallerToChild) + " " +
                        internal::to_string(upstream->end) + ": " + upstream->error;
                return SessionOutcome::StreamFailed;

            case LoopEnd::ReadFailed:
                error = std::string("Forwarding ") +
                        internal::to_string(Direction::CallerToChild) + " " +
                        internal::to_string(upstream->end) + ": " + upstream->error;
                return SessionOutcome::StreamFailed;

            case LoopEnd::Cancelled:
                break;
            }
        }

        if (exited)
            return classify_exit(*exited, error);

        // Backend output ending on its own is not terminal; its exit is
        wait_for_event();
    }
}

SessionOutcome Session::classify_exit(const ExitStatus& status, std::string& error) const
{
    if (status.success())
    {
        logger_.info("MCP server exited cleanly");
        return SessionOutcome::Clean;
    }

    if (status.lost)
        logger_.warning("Exit status of MCP server could not be collected");

    error = "MCP server exited with " + status.describe();
    return SessionOutcome::BackendFailed;
}

void Session::wait_for_event()
{
    struct pollfd fds[2];
    fds[0].fd = events_->fd();
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = interrupt_->fd();
    fds[1].events = POLLIN;
    fds[1].revents = 0;

    int rc;
    do
    {
        rc = ::poll(fds, 2, -1);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0)
        throw StreamError(std::string("poll failed while supervising session: ") +
                          std::system_category().message(errno));

    events_->drain();
}

void Session::release(SessionResult& result)
{
    if (forwarder_)
    {
        // Input to the backend stops first so shutdown() owns its stdin
        forwarder_->cancel(Direction::CallerToChild);
        forwarder_->wait(Direction::CallerToChild);
    }

    if (child_)
    {
        logger_.debug("Stopping backend pid " + std::to_string(child_->pid()));
        subprocess::ShutdownReport report = child_->shutdown(options_.grace_period);
        if (report.sent_kill)
            logger_.warning("MCP server ignored SIGTERM, killed");
        else if (report.sent_terminate)
            logger_.info("MCP server did not exit on end of input, sent SIGTERM");
        result.exit_status = report.status;
        logger_.debug("Backend reaped: " + report.status.describe());
    }

    if (forwarder_)
    {
        if (!forwarder_->wait_for(Direction::ChildToCaller, options_.grace_period))
            logger_.warning("Backend output still open after exit, discarding the rest");

        forwarder_->cancel();
        forwarder_->join();

        if (auto upstream = forwarder_->result(Direction::CallerToChild))
            result.bytes_to_backend = upstream->bytes;
        if (auto downstream = forwarder_->result(Direction::ChildToCaller))
            result.bytes_from_backend = downstream->bytes;

        forwarder_.reset();
    }

    caller_in_->close();
    caller_out_->close();

    transition(SessionState::Terminated);
    result.final_state = SessionState::Terminated;

    logger_.info(std::string("Session finished: ") + to_string(result.outcome) +
                 " (exit status " + std::to_string(result.exit_code()) + ")");
}

} // namespace dispatcher
