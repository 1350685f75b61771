#ifndef DISPATCHER_INTERNAL_STREAM_FORWARDER_HPP
#define DISPATCHER_INTERNAL_STREAM_FORWARDER_HPP

#include "../subprocess/process.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace dispatcher
{
namespace internal
{

enum class Direction
{
    CallerToChild, // Loop A
    ChildToCaller  // Loop B
};

const char* to_string(Direction direction);

enum class LoopEnd
{
    EndOfStream,
    ReadFailed,
    WriteFailed,
    Cancelled
};

const char* to_string(LoopEnd end);

struct LoopResult
{
    LoopEnd end = LoopEnd::EndOfStream;
    size_t bytes = 0;  // Bytes delivered to the sink
    std::string error; // Empty unless ReadFailed / WriteFailed

    bool failed() const
    {
        return end == LoopEnd::ReadFailed || end == LoopEnd::WriteFailed;
    }
};

struct ForwardResult
{
    LoopResult caller_to_child;
    LoopResult child_to_caller;
};

/**
 * Two independent byte-transparent copy loops between a caller and a child.
 *
 * Loop A copies caller_in -> child_in and closes child_in when it ends.
 * Loop B copies child_out -> caller_out and closes caller_out when it ends.
 * Bytes are never inspected; each chunk is written fully before the next read.
 * A loop blocks only in poll(2) on its source (or its sink while writing) plus
 * its cancellation pipe, so a stalled direction never delays the other.
 *
 * The forwarder borrows the four pipes; they must outlive it.
 */
class StreamForwarder
{
  public:
    // Invoked on the loop's thread when that loop ends. Must not throw.
    using CompletionCallback = std::function<void(Direction, const LoopResult&)>;

    StreamForwarder(subprocess::ReadPipe& caller_in, subprocess::WritePipe& caller_out,
                    subprocess::WritePipe& child_in, subprocess::ReadPipe& child_out,
                    size_t buffer_size = 64 * 1024);
    ~StreamForwarder();

    StreamForwarder(const StreamForwarder&) = delete;
    StreamForwarder& operator=(const StreamForwarder&) = delete;

    void start(CompletionCallback on_complete = nullptr);

    // Stop one or both loops. The loop's sink is closed as it exits.
    void cancel(Direction direction) noexcept;
    void cancel() noexcept;

    // Wait for one loop to end
    void wait(Direction direction);

    // Bounded variant; true if the loop has ended
    bool wait_for(Direction direction, std::chrono::milliseconds timeout);

    // Join both loop threads
    void join();

    std::optional<LoopResult> result(Direction direction) const;

  private:
    // Caller holds mutex_
    bool loop_done(Direction direction) const;

    LoopResult copy_loop(subprocess::ReadPipe& source, subprocess::WritePipe& sink,
                         int cancel_fd);
    void run_loop(Direction direction);

    subprocess::ReadPipe& caller_in_;
    subprocess::WritePipe& caller_out_;
    subprocess::WritePipe& child_in_;
    subprocess::ReadPipe& child_out_;
    size_t buffer_size_;

    subprocess::WakePipe cancel_upstream_;
    subprocess::WakePipe cancel_downstream_;

    CompletionCallback on_complete_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    std::optional<LoopResult> upstream_result_;
    std::optional<LoopResult> downstream_result_;

    std::thread upstream_thread_;
    std::thread downstream_thread_;
};

/// Start both loops and block until both have ended
ForwardResult forward(subprocess::ReadPipe& caller_in, subprocess::WritePipe& caller_out,
                      subprocess::WritePipe& child_in, subprocess::ReadPipe& child_out);

} // namespace internal
} // namespace dispatcher

#endif // DISPATCHER_INTERNAL_STREAM_FORWARDER_HPP
