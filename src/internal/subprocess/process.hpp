#ifndef DISPATCHER_SUBPROCESS_PROCESS_HPP
#define DISPATCHER_SUBPROCESS_PROCESS_HPP

#include <chrono>
#include <dispatcher/types.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dispatcher
{
namespace subprocess
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;

// Readable end of a pipe (or any readable descriptor)
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // No copy, move only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Take ownership of an existing descriptor
    static ReadPipe adopt(int fd);

    // Read up to size bytes, returns actual bytes read
    // Returns 0 on EOF, throws StreamError on error
    size_t read(char* buffer, size_t size);

    // Block until readable (data, EOF or error) or until cancel_fd becomes
    // readable. Returns false when cancelled.
    bool wait_readable(int cancel_fd);

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

    int fd() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Writable end of a pipe (or any writable descriptor)
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // No copy, move only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Take ownership of an existing descriptor
    static WritePipe adopt(int fd);

    // Write every byte, waiting for writability between chunks. Returns false
    // if cancel_fd became readable first; throws StreamError on failure.
    bool write_all(const char* data, size_t size, int cancel_fd = -1);

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

    int fd() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// Self-pipe used to wake a poll(2) loop. notify() is async-signal-safe.
class WakePipe
{
  public:
    WakePipe();
    ~WakePipe();

    WakePipe(const WakePipe&) = delete;
    WakePipe& operator=(const WakePipe&) = delete;

    void notify() noexcept;

    // Discard pending notifications
    void drain() noexcept;

    // Descriptor to poll for POLLIN
    int fd() const noexcept
    {
        return read_fd_;
    }

  private:
    int read_fd_ = -1;
    int write_fd_ = -1;
};

// Process configuration
struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true; // If false, environment is the complete block
    bool redirect_stdin = true;
    bool redirect_stdout = true; // stderr is always inherited from the parent

    // Invoked on the reaper thread once the child has been reaped. Must not throw.
    std::function<void(const ExitStatus&)> on_exit;
};

// Result of Process::shutdown
struct ShutdownReport
{
    ExitStatus status;
    bool sent_terminate = false; // Child ignored stdin EOF for a full grace period
    bool sent_kill = false;      // Child ignored SIGTERM for a full grace period
};

// Main Process class
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws SpawnError when the executable cannot be found or
    // executed, or the OS refuses to create the process.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Get pipes (only valid if redirected)
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();

    // Process control
    bool is_running() const;
    std::optional<ExitStatus> try_wait(); // Non-blocking, returns status if reaped
    ExitStatus wait();                    // Blocking wait
    std::optional<ExitStatus> wait_for(std::chrono::milliseconds timeout);
    void terminate();                     // SIGTERM
    void kill();                          // SIGKILL

    // Close stdin, wait grace; SIGTERM, wait grace; SIGKILL and reap
    ShutdownReport shutdown(std::chrono::milliseconds grace);

    // Process ID
    int pid() const;

  private:
    void send_signal(int sig);

    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
};

// Helper function to find executable in a PATH-style search list
// (defaults to this process's PATH)
std::optional<std::string> find_executable(const std::string& name,
                                           const std::optional<std::string>& search_path =
                                               std::nullopt);

} // namespace subprocess
} // namespace dispatcher

#endif // DISPATCHER_SUBPROCESS_PROCESS_HPP
