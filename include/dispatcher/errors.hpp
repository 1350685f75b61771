#ifndef DISPATCHER_ERRORS_HPP
#define DISPATCHER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace dispatcher
{

// Base exception
class DispatcherError : public std::runtime_error
{
  public:
    explicit DispatcherError(const std::string& message) : std::runtime_error(message) {}
};

// Route table missing or malformed. Raised before any session starts.
class ConfigurationError : public DispatcherError
{
  public:
    explicit ConfigurationError(const std::string& message) : DispatcherError(message) {}

    ConfigurationError(const std::string& message, std::vector<std::string> problems)
        : DispatcherError(message), problems_(std::move(problems))
    {
    }

    // Individual validation problems (empty for I/O and syntax errors)
    const std::vector<std::string>& problems() const
    {
        return problems_;
    }

  private:
    std::vector<std::string> problems_;
};

// Backend command missing, not executable, rejected by verification, or
// process creation refused by the OS
class SpawnError : public DispatcherError
{
  public:
    SpawnError(const std::string& message, std::string command, std::vector<std::string> args,
               int error_code = 0)
        : DispatcherError(message), command_(std::move(command)), args_(std::move(args)),
          error_code_(error_code)
    {
    }

    const std::string& command() const
    {
        return command_;
    }

    const std::vector<std::string>& args() const
    {
        return args_;
    }

    // errno reported by the failing system call, 0 when not applicable
    int error_code() const
    {
        return error_code_;
    }

  private:
    std::string command_;
    std::vector<std::string> args_;
    int error_code_;
};

// I/O failure while relaying bytes
class StreamError : public DispatcherError
{
  public:
    explicit StreamError(const std::string& message) : DispatcherError(message) {}
};

// Backend terminated with a nonzero status or by a signal
class ChildExitError : public DispatcherError
{
  public:
    ChildExitError(const std::string& message, int exit_code, int signal = 0)
        : DispatcherError(message), exit_code_(exit_code), signal_(signal)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

    // Terminating signal, 0 when the backend exited normally
    int signal() const
    {
        return signal_;
    }

  private:
    int exit_code_;
    int signal_;
};

} // namespace dispatcher

#endif // DISPATCHER_ERRORS_HPP
