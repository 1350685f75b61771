#include "../../src/internal/subprocess/process.hpp"
#include "../test_utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <dispatcher/errors.hpp>
#include <fstream>
#include <gtest/gtest.h>
#include <poll.h>
#include <thread>

using namespace dispatcher;
using namespace dispatcher::subprocess;
using dispatcher::test::process_exists;
using dispatcher::test::read_line;
using dispatcher::test::write_fully;

namespace
{

bool readable(int fd)
{
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN) != 0;
}

} // namespace

// Test basic process spawn
TEST(ProcessTest, SpawnEcho)
{
    Process proc;
    proc.spawn("/bin/echo", {"Hello"});

    EXPECT_TRUE(proc.is_running() || proc.try_wait().has_value());
    ExitStatus status = proc.wait();
    EXPECT_TRUE(status.success());
}

// Test stdout capture
TEST(ProcessTest, CaptureStdout)
{
    Process proc;
    proc.spawn("/bin/echo", {"TestOutput"});

    std::string output = read_line(proc.stdout_pipe().fd());
    EXPECT_EQ(output, "TestOutput\n");

    proc.wait();
}

// Test stdin write
TEST(ProcessTest, WriteStdin)
{
    Process proc;
    proc.spawn("/bin/cat", {});

    ASSERT_TRUE(write_fully(proc.stdin_pipe().fd(), "Hello\n"));
    proc.stdin_pipe().close(); // EOF

    std::string output = read_line(proc.stdout_pipe().fd());
    EXPECT_EQ(output, "Hello\n");

    EXPECT_TRUE(proc.wait().success());
}

TEST(ProcessTest, NonzeroExitCode)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "exit 3"});

    ExitStatus status = proc.wait();
    EXPECT_FALSE(status.signaled());
    EXPECT_EQ(status.code, 3);
}

// Test process termination
TEST(ProcessTest, Terminate)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});

    EXPECT_TRUE(proc.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    proc.terminate();

    ExitStatus status = proc.wait();
    EXPECT_TRUE(status.signaled());
    EXPECT_EQ(status.signal, SIGTERM);
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, WaitForTimesOut)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(proc.wait_for(std::chrono::milliseconds(100)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(90));

    proc.kill();
    auto status = proc.wait_for(std::chrono::seconds(5));
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->signal, SIGKILL);
}

TEST(ProcessTest, TryWaitAfterExit)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "exit 0"});
    proc.wait();

    auto status = proc.try_wait();
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->success());
}

TEST(ProcessTest, OnExitCallbackFiresAfterReap)
{
    std::atomic<int> observed{-1};
    ProcessOptions opts;
    opts.on_exit = [&](const ExitStatus& status) { observed.store(status.code); };

    Process proc;
    proc.spawn("/bin/sh", {"-c", "exit 7"}, opts);
    proc.wait();

    // The callback runs on the reaper thread just after waiters are released
    for (int i = 0; i < 100 && observed.load() == -1; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_EQ(observed.load(), 7);
}

TEST(ProcessTest, ExitStatusCollectedWhenSigchldIgnored)
{
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    struct sigaction previous;
    ASSERT_EQ(::sigaction(SIGCHLD, &ignore, &previous), 0);

    Process ok;
    ok.spawn("/bin/true", {});
    ExitStatus ok_status = ok.wait();

    Process failing;
    failing.spawn("/bin/sh", {"-c", "exit 5"});
    ExitStatus failing_status = failing.wait();

    ::sigaction(SIGCHLD, &previous, nullptr);

    EXPECT_FALSE(ok_status.lost);
    EXPECT_TRUE(ok_status.success());
    EXPECT_EQ(failing_status.code, 5);
}

// ============================================================================
// Spawn failures
// ============================================================================

TEST(ProcessTest, MissingCommandThrowsSpawnError)
{
    Process proc;
    try
    {
        proc.spawn("this_should_not_exist_12345", {"--flag"});
        FAIL() << "Expected SpawnError";
    }
    catch (const SpawnError& e)
    {
        EXPECT_EQ(e.command(), "this_should_not_exist_12345");
        ASSERT_EQ(e.args().size(), 1u);
        EXPECT_EQ(e.args()[0], "--flag");
        EXPECT_NE(std::string(e.what()).find("this_should_not_exist_12345"), std::string::npos);
    }
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, MissingWorkingDirectoryThrowsSpawnError)
{
    ProcessOptions opts;
    opts.working_directory = "/nonexistent/dir/for/mcp_dispatcher";

    Process proc;
    try
    {
        proc.spawn("/bin/echo", {"unreachable"}, opts);
        FAIL() << "Expected SpawnError";
    }
    catch (const SpawnError& e)
    {
        EXPECT_EQ(e.error_code(), ENOENT);
    }
}

TEST(ProcessTest, NotExecutableThrowsSpawnError)
{
    dispatcher::test::TempDir dir;
    std::string script = dir.file("plain.txt");
    {
        std::ofstream out(script);
        out << "#!/bin/sh\necho hi\n";
    }

    Process proc;
    EXPECT_THROW(proc.spawn(script, {}), SpawnError);
}

// ============================================================================
// Shutdown escalation
// ============================================================================

TEST(ProcessTest, ShutdownClosesStdinFirst)
{
    Process proc;
    proc.spawn("/bin/cat", {});

    ShutdownReport report = proc.shutdown(std::chrono::milliseconds(2000));
    EXPECT_FALSE(report.sent_terminate);
    EXPECT_FALSE(report.sent_kill);
    EXPECT_TRUE(report.status.success());
}

TEST(ProcessTest, ShutdownWithHugeGraceStillWaits)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "trap '' TERM; cat >/dev/null; sleep 0.2"});

    ShutdownReport report = proc.shutdown(std::chrono::milliseconds(10000000000000LL));
    EXPECT_FALSE(report.sent_terminate);
    EXPECT_FALSE(report.sent_kill);
    EXPECT_TRUE(report.status.success());
}

TEST(ProcessTest, ShutdownSendsTerminate)
{
    Process proc;
    // Ignores stdin EOF but not SIGTERM
    proc.spawn("/bin/sleep", {"30"});

    ShutdownReport report = proc.shutdown(std::chrono::milliseconds(200));
    EXPECT_TRUE(report.sent_terminate);
    EXPECT_FALSE(report.sent_kill);
    EXPECT_EQ(report.status.signal, SIGTERM);
}

TEST(ProcessTest, ShutdownEscalatesToKill)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "trap '' TERM; echo ready; while :; do sleep 1; done"});
    ASSERT_EQ(read_line(proc.stdout_pipe().fd()), "ready\n");
    int pid = proc.pid();

    ShutdownReport report = proc.shutdown(std::chrono::milliseconds(200));
    EXPECT_TRUE(report.sent_terminate);
    EXPECT_TRUE(report.sent_kill);
    EXPECT_EQ(report.status.signal, SIGKILL);
    EXPECT_FALSE(process_exists(pid));
}

TEST(ProcessTest, DestructorKillsRunningChild)
{
    int pid = 0;
    {
        Process proc;
        proc.spawn("/bin/sleep", {"30"});
        pid = proc.pid();
        EXPECT_TRUE(process_exists(pid));
    }
    EXPECT_FALSE(process_exists(pid));
}

// ============================================================================
// Helpers and options
// ============================================================================

// Test find_executable
TEST(ProcessTest, FindExecutable)
{
    auto sh = find_executable("sh");
    EXPECT_TRUE(sh.has_value());

    auto nonexistent = find_executable("this_should_not_exist_12345");
    EXPECT_FALSE(nonexistent.has_value());
}

TEST(ProcessTest, FindExecutableWithSearchPath)
{
    auto cat = find_executable("cat", std::string("/nonexistent:/bin"));
    ASSERT_TRUE(cat.has_value());
    EXPECT_EQ(*cat, "/bin/cat");

    EXPECT_FALSE(find_executable("cat", std::string("/nonexistent")).has_value());
    EXPECT_EQ(find_executable("/bin/cat").value_or(""), "/bin/cat");
}

// Test working directory
TEST(ProcessTest, WorkingDirectory)
{
    Process proc;
    ProcessOptions opts;
    opts.working_directory = "/";

    proc.spawn("/bin/pwd", {}, opts);

    std::string output = read_line(proc.stdout_pipe().fd());
    EXPECT_EQ(output, "/\n");

    proc.wait();
}

// Test environment variables
TEST(ProcessTest, Environment)
{
    Process proc;
    ProcessOptions opts;
    opts.environment["TEST_VAR"] = "test_value";

    proc.spawn("/bin/sh", {"-c", "echo $TEST_VAR"}, opts);

    std::string output = read_line(proc.stdout_pipe().fd());
    EXPECT_EQ(output, "test_value\n");

    proc.wait();
}

TEST(ProcessTest, ExplicitEnvironmentBlock)
{
    ::setenv("MCP_DISPATCHER_PARENT_ONLY", "leaked", 1);

    Process proc;
    ProcessOptions opts;
    opts.inherit_environment = false;
    opts.environment["PATH"] = "/bin:/usr/bin";
    opts.environment["ONLY_VAR"] = "present";

    proc.spawn("sh", {"-c", "echo \"$ONLY_VAR:${MCP_DISPATCHER_PARENT_ONLY:-unset}\""}, opts);
    std::string output = read_line(proc.stdout_pipe().fd());
    ::unsetenv("MCP_DISPATCHER_PARENT_ONLY");

    EXPECT_EQ(output, "present:unset\n");
    proc.wait();
}

TEST(ProcessTest, ChildGetsDefaultSigpipe)
{
    auto previous = std::signal(SIGPIPE, SIG_IGN);

    Process proc;
    // SigIgn in /proc/self/status is a hex mask; bit 13 is SIGPIPE
    proc.spawn("/bin/sh", {"-c", "grep SigIgn /proc/self/status"});
    std::string output = read_line(proc.stdout_pipe().fd());
    proc.wait();
    std::signal(SIGPIPE, previous);

    auto pos = output.find_first_of("0123456789abcdef");
    ASSERT_NE(pos, std::string::npos);
    unsigned long long mask = std::stoull(output.substr(pos), nullptr, 16);
    EXPECT_EQ(mask & (1ULL << (SIGPIPE - 1)), 0u);
}

// Test PID
TEST(ProcessTest, ProcessID)
{
    Process proc;
    proc.spawn("/bin/echo", {"test"});

    int pid = proc.pid();
    EXPECT_GT(pid, 0);

    proc.wait();
}

// Test multiple sequential processes
TEST(ProcessTest, SequentialProcesses)
{
    for (int i = 0; i < 3; i++)
    {
        Process proc;
        proc.spawn("/bin/echo", {"test" + std::to_string(i)});

        std::string output = read_line(proc.stdout_pipe().fd());
        EXPECT_EQ(output, "test" + std::to_string(i) + "\n");

        EXPECT_TRUE(proc.wait().success());
    }
}

// Test reading multiple lines
TEST(ProcessTest, ReadMultipleLines)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "echo Line1; echo Line2"});

    std::string line1 = read_line(proc.stdout_pipe().fd());
    std::string line2 = read_line(proc.stdout_pipe().fd());

    EXPECT_EQ(line1, "Line1\n");
    EXPECT_EQ(line2, "Line2\n");

    proc.wait();
}

TEST(WakePipeTest, NotifyWakesPoll)
{
    WakePipe wake;
    EXPECT_FALSE(readable(wake.fd()));

    wake.notify();
    wake.notify(); // Coalesces
    EXPECT_TRUE(readable(wake.fd()));

    wake.drain();
    EXPECT_FALSE(readable(wake.fd()));
}
