// POSIX implementation of subprocess process management
// Linux (pipe2, waitid)

#include "process.hpp"

#include <algorithm>
#include <climits>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <dispatcher/errors.hpp>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace dispatcher
{
namespace subprocess
{

// Longest single bounded wait
constexpr std::chrono::milliseconds MAX_WAIT = std::chrono::hours(24 * 365);

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    ExitStatus status;

    // Guards running/status. A running pid is never reaped while this is held,
    // so signalling under the lock cannot hit a recycled pid.
    std::mutex mutex;
    std::condition_variable exited;
    std::thread reaper;
    std::function<void(const ExitStatus&)> on_exit;

    ~ProcessHandle()
    {
        if (reaper.joinable())
        {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (running)
                    ::kill(pid, SIGKILL);
            }
            reaper.join();
        }
    }
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

// poll(2) a descriptor together with an optional cancellation descriptor.
// Returns false when cancel_fd fired; otherwise the revents of fd.
static bool poll_with_cancel(int fd, short events, int cancel_fd, short& revents)
{
    struct pollfd fds[2];
    fds[0].fd = fd;
    fds[0].events = events;
    fds[0].revents = 0;
    fds[1].fd = cancel_fd;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    nfds_t count = cancel_fd >= 0 ? 2 : 1;

    while (true)
    {
        int result = ::poll(fds, count, -1);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            throw StreamError("poll failed: " + get_errno_message());
        }

        if (count == 2 && fds[1].revents != 0)
            return false;

        if (fds[0].revents & POLLNVAL)
            throw StreamError("poll on invalid descriptor " + std::to_string(fd));

        if (fds[0].revents != 0)
        {
            revents = fds[0].revents;
            return true;
        }
    }
}

static ExitStatus decode_wait_status(int raw)
{
    ExitStatus status;
    if (WIFEXITED(raw))
        status.code = WEXITSTATUS(raw);
    else if (WIFSIGNALED(raw))
        status.signal = WTERMSIG(raw);
    return status;
}

// Runs on the reaper thread; the only place the child is waited for.
static void reap_child(ProcessHandle* handle)
{
    // Wait without reaping first so the pid stays valid for kill() until
    // running is cleared under the lock
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (::waitid(P_PID, static_cast<id_t>(handle->pid), &info, WEXITED | WNOWAIT) == -1)
    {
        if (errno != EINTR)
            break;
    }

    ExitStatus status;
    std::function<void(const ExitStatus&)> on_exit;
    {
        std::lock_guard<std::mutex> lock(handle->mutex);
        int raw = 0;
        pid_t result;
        do
        {
            result = ::waitpid(handle->pid, &raw, 0);
        } while (result == -1 && errno == EINTR);

        // ECHILD: something else collected the child (SIGCHLD ignored or
        // SA_NOCLDWAIT set after spawn); the status is gone
        if (result == handle->pid)
            status = decode_wait_status(raw);
        else
            status.lost = true;

        handle->status = status;
        handle->running = false;
        on_exit = handle->on_exit;
    }
    handle->exited.notify_all();

    if (on_exit)
        on_exit(status);
}

[[noreturn]] static void report_child_failure(int error_fd, int err)
{
    ssize_t ignored = ::write(error_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

// With SIGCHLD ignored (or SA_NOCLDWAIT) the kernel reaps children on its own
// and waitpid fails with ECHILD. The disposition is inherited across exec, so
// a host may hand it to us; restore waitable children before forking.
static void ensure_children_waitable()
{
    struct sigaction current;
    if (::sigaction(SIGCHLD, nullptr, &current) != 0)
        return;

    const bool ignored = !(current.sa_flags & SA_SIGINFO) && current.sa_handler == SIG_IGN;
    if (!ignored && !(current.sa_flags & SA_NOCLDWAIT))
        return;

    struct sigaction action = current;
    if (ignored)
    {
        action.sa_handler = SIG_DFL;
        action.sa_flags = 0;
    }
    action.sa_flags &= ~SA_NOCLDWAIT;
    ::sigaction(SIGCHLD, &action, nullptr);
}

static std::string join_command(const std::string& executable,
                                const std::vector<std::string>& args)
{
    std::string result = executable;
    for (const auto& arg : args)
        result += " " + arg;
    return result;
}

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

ReadPipe ReadPipe::adopt(int fd)
{
    ReadPipe pipe;
    pipe.handle_->fd = fd;
    return pipe;
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw StreamError("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);

        if (errno == EINTR)
            continue;

        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            // Descriptor inherited in non-blocking mode: wait for data instead of
            // reporting a spurious EOF
            short revents = 0;
            poll_with_cancel(handle_->fd, POLLIN, -1, revents);
            continue;
        }

        throw StreamError("Read failed: " + get_errno_message());
    }
}

bool ReadPipe::wait_readable(int cancel_fd)
{
    if (!is_open())
        throw StreamError("Pipe is not open");

    short revents = 0;
    return poll_with_cancel(handle_->fd, POLLIN, cancel_fd, revents);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

int ReadPipe::fd() const
{
    return handle_ ? handle_->fd : -1;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

WritePipe WritePipe::adopt(int fd)
{
    WritePipe pipe;
    pipe.handle_->fd = fd;
    return pipe;
}

bool WritePipe::write_all(const char* data, size_t size, int cancel_fd)
{
    if (!is_open())
        throw StreamError("Pipe is not open");

    size_t written = 0;
    while (written < size)
    {
        short revents = 0;
        if (!poll_with_cancel(handle_->fd, POLLOUT, cancel_fd, revents))
            return false;

        // At most PIPE_BUF per write: once POLLOUT is reported that much fits
        // without blocking, so cancellation stays responsive
        size_t chunk = std::min(size - written, static_cast<size_t>(PIPE_BUF));
        ssize_t n = ::write(handle_->fd, data + written, chunk);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;
            if (errno == EPIPE)
                throw StreamError("Broken pipe (reader closed its end)");
            throw StreamError("Write failed: " + get_errno_message());
        }

        written += static_cast<size_t>(n);
    }

    return true;
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

int WritePipe::fd() const
{
    return handle_ ? handle_->fd : -1;
}

// ============================================================================
// WakePipe implementation
// ============================================================================

WakePipe::WakePipe()
{
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0)
        throw StreamError("Failed to create wake pipe: " + get_errno_message());
    read_fd_ = fds[0];
    write_fd_ = fds[1];
}

WakePipe::~WakePipe()
{
    if (read_fd_ >= 0)
        ::close(read_fd_);
    if (write_fd_ >= 0)
        ::close(write_fd_);
}

void WakePipe::notify() noexcept
{
    // EAGAIN means a wakeup is already pending
    const char byte = 1;
    ssize_t ignored = ::write(write_fd_, &byte, 1);
    (void)ignored;
}

void WakePipe::drain() noexcept
{
    char buffer[64];
    while (::read(read_fd_, buffer, sizeof(buffer)) > 0)
    {
    }
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (is_running())
    {
        kill();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->pid != 0)
        throw std::logic_error("Process already spawned");

    const std::string command_line = join_command(executable, args);

    // Build the complete environment block
    std::map<std::string, std::string> env;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string item(*entry);
            auto eq = item.find('=');
            if (eq != std::string::npos && eq > 0)
                env[item.substr(0, eq)] = item.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        env[key] = value; // Overwrite if exists

    // Resolve the executable before fork so the child only needs
    // async-signal-safe calls
    auto path_it = env.find("PATH");
    std::string search_path = path_it != env.end() ? path_it->second : "/usr/bin:/bin";
    auto resolved = find_executable(executable, search_path);
    if (!resolved)
    {
        throw SpawnError("Executable not found or not executable: '" + command_line + "'",
                         executable, args, ENOENT);
    }

    // argv / envp storage must outlive fork()
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_entries;
    env_entries.reserve(env.size());
    for (const auto& [key, value] : env)
        env_entries.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& entry : env_entries)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    // Every descriptor is close-on-exec; dup2 clears the flag on 0/1/2
    std::vector<int> opened;
    auto close_opened = [&opened]
    {
        for (int fd : opened)
            ::close(fd);
        opened.clear();
    };
    auto make_pipe = [&](int fds[2], const char* what)
    {
        if (::pipe2(fds, O_CLOEXEC) != 0)
        {
            int err = errno;
            close_opened();
            throw SpawnError(std::string("Failed to create ") + what +
                                 " pipe: " + get_errno_message(err),
                             executable, args, err);
        }
        opened.push_back(fds[0]);
        opened.push_back(fds[1]);
    };

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    if (options.redirect_stdin)
        make_pipe(stdin_pipe, "stdin");
    if (options.redirect_stdout)
        make_pipe(stdout_pipe, "stdout");

    // Reports setup/exec failures from the child; closed by a successful exec
    make_pipe(error_pipe, "error");

    ensure_children_waitable();

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close_opened();
        throw SpawnError("Failed to fork process for '" + command_line +
                             "': " + get_errno_message(err),
                         executable, args, err);
    }

    if (pid == 0)
    {
        // Child process
        int error_fd = error_pipe[1];

        // Ignored dispositions survive exec; give the backend the defaults
        struct sigaction dfl;
        std::memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigemptyset(&dfl.sa_mask);
        sigaction(SIGPIPE, &dfl, nullptr);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (options.redirect_stdin && dup2(stdin_pipe[0], STDIN_FILENO) < 0)
            report_child_failure(error_fd, errno);

        if (options.redirect_stdout && dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
            report_child_failure(error_fd, errno);

        // Change working directory
        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            report_child_failure(error_fd, errno);

        execve(resolved->c_str(), argv.data(), envp.data());

        // If execve returns, it failed
        report_child_failure(error_fd, errno);
    }

    // Parent process
    ::close(error_pipe[1]);
    int child_errno = 0;
    ssize_t error_read;
    do
    {
        error_read = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (error_read < 0 && errno == EINTR);
    int read_errno = errno;
    ::close(error_pipe[0]);
    opened.erase(std::remove_if(opened.begin(), opened.end(),
                                [&](int fd) { return fd == error_pipe[0] || fd == error_pipe[1]; }),
                 opened.end());

    if (error_read != 0)
    {
        int err = error_read > 0 ? child_errno : read_errno;
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR)
        {
        }
        close_opened();
        throw SpawnError("Failed to execute '" + command_line + "': " + get_errno_message(err),
                         executable, args, err);
    }

    // Close the child's ends and store handles
    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]);
        stdin_ = std::make_unique<WritePipe>(WritePipe::adopt(stdin_pipe[1]));
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]);
        stdout_ = std::make_unique<ReadPipe>(ReadPipe::adopt(stdout_pipe[0]));
    }

    opened.clear();

    // Store process information
    {
        std::lock_guard<std::mutex> lock(handle_->mutex);
        handle_->pid = pid;
        handle_->running = true;
        handle_->on_exit = options.on_exit;
    }

    try
    {
        handle_->reaper = std::thread(reap_child, handle_.get());
    }
    catch (const std::system_error& e)
    {
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR)
        {
        }
        handle_->running = false;
        throw SpawnError("Failed to start reaper for '" + command_line + "': " + e.what(),
                         executable, args, e.code().value());
    }
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

bool Process::is_running() const
{
    if (!handle_)
        return false;

    std::lock_guard<std::mutex> lock(handle_->mutex);
    return handle_->pid > 0 && handle_->running;
}

std::optional<ExitStatus> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return ExitStatus{};

    std::lock_guard<std::mutex> lock(handle_->mutex);
    if (handle_->running)
        return std::nullopt;
    return handle_->status;
}

ExitStatus Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return ExitStatus{};

    std::unique_lock<std::mutex> lock(handle_->mutex);
    handle_->exited.wait(lock, [this] { return !handle_->running; });
    return handle_->status;
}

std::optional<ExitStatus> Process::wait_for(std::chrono::milliseconds timeout)
{
    if (!handle_ || handle_->pid == 0)
        return ExitStatus{};

    // condition_variable converts to the clock's nanoseconds; keep that in range
    timeout = std::min(timeout, MAX_WAIT);

    std::unique_lock<std::mutex> lock(handle_->mutex);
    if (!handle_->exited.wait_for(lock, timeout, [this] { return !handle_->running; }))
        return std::nullopt;
    return handle_->status;
}

void Process::send_signal(int sig)
{
    if (!handle_)
        return;

    std::lock_guard<std::mutex> lock(handle_->mutex);
    if (handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, sig);
}

void Process::terminate()
{
    send_signal(SIGTERM);
}

void Process::kill()
{
    send_signal(SIGKILL);
}

ShutdownReport Process::shutdown(std::chrono::milliseconds grace)
{
    ShutdownReport report;

    // EOF on stdin is the polite request for stdio servers
    if (stdin_)
        stdin_->close();

    if (auto status = wait_for(grace))
    {
        report.status = *status;
        return report;
    }

    report.sent_terminate = true;
    terminate();
    if (auto status = wait_for(grace))
    {
        report.status = *status;
        return report;
    }

    report.sent_kill = true;
    kill();
    report.status = wait();
    return report;
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

std::optional<std::string> find_executable(const std::string& name,
                                           const std::optional<std::string>& search_path)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    auto is_executable = [](const fs::path& path)
    {
        std::error_code ec;
        return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    };

    // If it's an absolute path and exists, check if it's executable
    fs::path exe_path(name);
    if (exe_path.is_absolute())
    {
        if (is_executable(exe_path))
            return name;
        return std::nullopt;
    }

    // If name contains a path separator, treat as relative path
    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    std::string path_str;
    if (search_path)
    {
        path_str = *search_path;
    }
    else if (const char* path_env = std::getenv("PATH"))
    {
        path_str = path_env;
    }
    else
    {
        // No PATH set - try current directory
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    // Split PATH by colon; an empty entry means the current directory
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        fs::path test_path = fs::path(dir.empty() ? "." : dir) / name;
        if (is_executable(test_path))
            return test_path.string();

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace dispatcher
