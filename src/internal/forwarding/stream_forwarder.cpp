#include "stream_forwarder.hpp"

#include <dispatcher/errors.hpp>
#include <signal.h>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace dispatcher
{
namespace internal
{

const char* to_string(Direction direction)
{
    switch (direction)
    {
    case Direction::CallerToChild:
        return "caller->backend";
    case Direction::ChildToCaller:
        return "backend->caller";
    }
    return "unknown";
}

const char* to_string(LoopEnd end)
{
    switch (end)
    {
    case LoopEnd::EndOfStream:
        return "end of stream";
    case LoopEnd::ReadFailed:
        return "read failed";
    case LoopEnd::WriteFailed:
        return "write failed";
    case LoopEnd::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

StreamForwarder::StreamForwarder(subprocess::ReadPipe& caller_in,
                                 subprocess::WritePipe& caller_out,
                                 subprocess::WritePipe& child_in,
                                 subprocess::ReadPipe& child_out, size_t buffer_size)
    : caller_in_(caller_in), caller_out_(caller_out), child_in_(child_in),
      child_out_(child_out), buffer_size_(buffer_size > 0 ? buffer_size : 64 * 1024)
{
}

StreamForwarder::~StreamForwarder()
{
    cancel();
    join();
}

void StreamForwarder::start(CompletionCallback on_complete)
{
    if (upstream_thread_.joinable() || downstream_thread_.joinable())
        throw std::logic_error("StreamForwarder already started");

    on_complete_ = std::move(on_complete);
    upstream_thread_ = std::thread(&StreamForwarder::run_loop, this, Direction::CallerToChild);
    try
    {
        downstream_thread_ =
            std::thread(&StreamForwarder::run_loop, this, Direction::ChildToCaller);
    }
    catch (const std::system_error&)
    {
        cancel(Direction::CallerToChild);
        upstream_thread_.join();
        throw;
    }
}

void StreamForwarder::cancel(Direction direction) noexcept
{
    if (direction == Direction::CallerToChild)
        cancel_upstream_.notify();
    else
        cancel_downstream_.notify();
}

void StreamForwarder::cancel() noexcept
{
    cancel(Direction::CallerToChild);
    cancel(Direction::ChildToCaller);
}

bool StreamForwarder::loop_done(Direction direction) const
{
    return direction == Direction::CallerToChild ? upstream_result_.has_value()
                                                 : downstream_result_.has_value();
}

void StreamForwarder::wait(Direction direction)
{
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [&] { return loop_done(direction); });
}

bool StreamForwarder::wait_for(Direction direction, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [&] { return loop_done(direction); });
}

void StreamForwarder::join()
{
    if (upstream_thread_.joinable())
        upstream_thread_.join();
    if (downstream_thread_.joinable())
        downstream_thread_.join();
}

std::optional<LoopResult> StreamForwarder::result(Direction direction) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return direction == Direction::CallerToChild ? upstream_result_ : downstream_result_;
}

LoopResult StreamForwarder::copy_loop(subprocess::ReadPipe& source, subprocess::WritePipe& sink,
                                      int cancel_fd)
{
    LoopResult result;
    std::vector<char> buffer(buffer_size_);

    while (true)
    {
        size_t n = 0;
        try
        {
            if (!source.wait_readable(cancel_fd))
            {
                result.end = LoopEnd::Cancelled;
                return result;
            }
            n = source.read(buffer.data(), buffer.size());
        }
        catch (const StreamError& e)
        {
            result.end = LoopEnd::ReadFailed;
            result.error = e.what();
            return result;
        }

        if (n == 0)
        {
            result.end = LoopEnd::EndOfStream;
            return result;
        }

        // The whole chunk goes out before the next read
        try
        {
            if (!sink.write_all(buffer.data(), n, cancel_fd))
            {
                result.end = LoopEnd::Cancelled;
                return result;
            }
        }
        catch (const StreamError& e)
        {
            result.end = LoopEnd::WriteFailed;
            result.error = e.what();
            return result;
        }

        result.bytes += n;
    }
}

void StreamForwarder::run_loop(Direction direction)
{
    // A reader that went away must surface as EPIPE on this thread instead of
    // terminating the process
    sigset_t block;
    sigemptyset(&block);
    sigaddset(&block, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &block, nullptr);

    const bool upstream = direction == Direction::CallerToChild;
    subprocess::ReadPipe& source = upstream ? caller_in_ : child_out_;
    subprocess::WritePipe& sink = upstream ? child_in_ : caller_out_;
    const int cancel_fd = upstream ? cancel_upstream_.fd() : cancel_downstream_.fd();

    LoopResult result = copy_loop(source, sink, cancel_fd);

    // Propagate end-of-stream to the other side
    sink.close();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (upstream)
            upstream_result_ = result;
        else
            downstream_result_ = result;
    }
    done_cv_.notify_all();

    if (on_complete_)
        on_complete_(direction, result);
}

ForwardResult forward(subprocess::ReadPipe& caller_in, subprocess::WritePipe& caller_out,
                      subprocess::WritePipe& child_in, subprocess::ReadPipe& child_out)
{
    StreamForwarder forwarder(caller_in, caller_out, child_in, child_out);
    forwarder.start();
    forwarder.join();

    ForwardResult result;
    result.caller_to_child = *forwarder.result(Direction::CallerToChild);
    result.child_to_caller = *forwarder.result(Direction::ChildToCaller);
    return result;
}

} // namespace internal
} // namespace dispatcher
