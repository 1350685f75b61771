#include "../test_utils.hpp"

#include <chrono>
#include <csignal>
#include <dispatcher/errors.hpp>
#include <dispatcher/session.hpp>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <thread>

using namespace dispatcher;
using namespace dispatcher::test;

namespace
{

constexpr std::chrono::milliseconds TEST_GRACE{300};

RouteTable echo_table()
{
    RouteTable table;
    table.default_server = make_server("echo", "/bin/cat");
    return table;
}

} // namespace

// Owns the test side of the caller pipes: the test writes requests into
// to_session and reads responses from from_session
class SessionTest : public IgnoreSigpipeTest
{
  protected:
    SessionOptions make_options()
    {
        SessionOptions options;
        options.caller_input_fd = to_session.release_read();
        options.caller_output_fd = from_session.release_write();
        options.workdir = "/workspace/project";
        options.environment = Environment{{"PATH", "/bin:/usr/bin"}};
        options.grace_period = TEST_GRACE;
        return options;
    }

    // Runs the session on its own thread
    void start(Session& session)
    {
        runner = std::thread([this, &session] { result = session.run(); });
    }

    SessionResult finish()
    {
        if (runner.joinable())
            runner.join();
        return result;
    }

    void TearDown() override
    {
        to_session.close_write();
        from_session.close_read();
        if (runner.joinable())
            runner.join();
        IgnoreSigpipeTest::TearDown();
    }

    TestPipe to_session;
    TestPipe from_session;
    LogCapture logs;
    std::thread runner;
    SessionResult result;
};

TEST_F(SessionTest, EchoBackendRoundTrip)
{
    Session session(echo_table(), make_options(), logs.logger());
    start(session);

    const std::string request = R"({"jsonrpc":"2.0","id":1,"method":"initialize"})"
                                "\n";
    ASSERT_TRUE(write_fully(to_session.write_fd, request));
    to_session.close_write();

    EXPECT_EQ(read_to_eof(from_session.read_fd), request);
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::Clean);
    EXPECT_EQ(r.exit_code(), 0);
    EXPECT_EQ(r.final_state, SessionState::Terminated);
    EXPECT_EQ(session.state(), SessionState::Terminated);
    ASSERT_TRUE(r.exit_status.has_value());
    EXPECT_TRUE(r.exit_status->success());
    EXPECT_EQ(r.bytes_to_backend, request.size());
    EXPECT_EQ(r.bytes_from_backend, request.size());
    EXPECT_TRUE(r.error.empty());
    EXPECT_NO_THROW(r.raise_for_outcome());
}

TEST_F(SessionTest, BinaryPayloadIsRelayedUnchanged)
{
    const std::string payload = binary_payload(200000);
    SessionOptions options = make_options();
    options.grace_period = std::chrono::milliseconds(2000);
    Session session(echo_table(), options, logs.logger());
    start(session);

    std::thread writer(
        [this, &payload]
        {
            write_fully(to_session.write_fd, payload);
            to_session.close_write();
        });
    std::string echoed = read_to_eof(from_session.read_fd);
    writer.join();
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::Clean);
    EXPECT_TRUE(echoed == payload) << "payload altered in transit";
}

TEST_F(SessionTest, RoutesOnWorkdirAndExportsIt)
{
    RouteTable table;
    table.rules.push_back(
        {"/repo/a*", make_shell_server("ServerA", "printf 'A:%s' \"$MCP_DISPATCHER_CWD\"")});
    table.rules.push_back({"/repo/b*", make_shell_server("ServerB", "printf B")});
    table.default_server = make_shell_server("ServerDefault", "printf default");

    SessionOptions options = make_options();
    options.workdir = "/repo/a/sub";
    Session session(table, options, logs.logger());
    start(session);

    EXPECT_EQ(read_to_eof(from_session.read_fd), "A:/repo/a/sub");
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::Clean);
    ASSERT_TRUE(r.target.has_value());
    EXPECT_EQ(r.target->name, "ServerA");
    EXPECT_EQ(r.workdir.path, "/repo/a/sub");
    EXPECT_EQ(r.workdir.source, WorkdirSource::Explicit);
    EXPECT_TRUE(logs.contains("Matched pattern '/repo/a*'"));
}

TEST_F(SessionTest, WorkdirOverrideVariableBeatsProcessDirectory)
{
    RouteTable table;
    table.rules.push_back({"/client/*", make_shell_server("client", "printf client")});
    table.default_server = make_shell_server("default", "printf default");

    SessionOptions options = make_options();
    options.workdir.reset();
    options.environment = Environment{{"PATH", "/bin:/usr/bin"},
                                      {WORKDIR_ENV_VAR, "/client/project"}};
    Session session(table, options, logs.logger());
    start(session);

    EXPECT_EQ(read_to_eof(from_session.read_fd), "client");
    SessionResult r = finish();
    EXPECT_EQ(r.workdir.source, WorkdirSource::Environment);
    EXPECT_EQ(r.workdir.variable, WORKDIR_ENV_VAR);
}

TEST_F(SessionTest, ServerEnvironmentOverridesInherited)
{
    RouteTable table;
    table.default_server =
        make_shell_server("env", "printf '%s:%s' \"$GREETING\" \"$INHERITED\"");
    table.default_server.env["GREETING"] = "override";

    SessionOptions options = make_options();
    options.environment = Environment{
        {"PATH", "/bin:/usr/bin"}, {"INHERITED", "yes"}, {"GREETING", "inherited"}};
    Session session(table, options, logs.logger());
    start(session);

    EXPECT_EQ(read_to_eof(from_session.read_fd), "override:yes");
    EXPECT_EQ(finish().outcome, SessionOutcome::Clean);
}

TEST_F(SessionTest, NonzeroExitIsBackendFailed)
{
    RouteTable table;
    table.default_server = make_shell_server("failing", "exit 3");

    Session session(table, make_options(), logs.logger());
    start(session);
    EXPECT_EQ(read_to_eof(from_session.read_fd), "");
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::BackendFailed);
    EXPECT_EQ(r.exit_code(), 70);
    EXPECT_EQ(r.final_state, SessionState::Terminated);
    ASSERT_TRUE(r.exit_status.has_value());
    EXPECT_EQ(r.exit_status->code, 3);
    EXPECT_NE(r.error.find("exit code 3"), std::string::npos);

    try
    {
        r.raise_for_outcome();
        FAIL() << "Expected ChildExitError";
    }
    catch (const ChildExitError& e)
    {
        EXPECT_EQ(e.exit_code(), 3);
        EXPECT_EQ(e.signal(), 0);
    }
}

TEST_F(SessionTest, MissingCommandIsSpawnFailed)
{
    RouteTable table;
    table.default_server = make_server("ghost", "/nonexistent/mcp-server", {"--stdio"});

    Session session(table, make_options(), logs.logger());
    start(session);

    // Caller output is closed even though nothing was spawned
    EXPECT_EQ(read_to_eof(from_session.read_fd), "");
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::SpawnFailed);
    EXPECT_EQ(r.exit_code(), 69);
    EXPECT_EQ(r.final_state, SessionState::Terminated);
    EXPECT_FALSE(r.exit_status.has_value());
    EXPECT_NE(r.error.find("/nonexistent/mcp-server"), std::string::npos);
    EXPECT_GE(logs.count(LogLevel::Error), 1u);

    try
    {
        r.raise_for_outcome();
        FAIL() << "Expected SpawnError";
    }
    catch (const SpawnError& e)
    {
        EXPECT_EQ(e.command(), "/nonexistent/mcp-server");
        ASSERT_EQ(e.args().size(), 1u);
    }
}

TEST_F(SessionTest, BareCommandResolvedAgainstInheritedPath)
{
    RouteTable table;
    table.default_server = make_server("echo", "cat");

    SessionOptions options = make_options();
    options.environment = Environment{{"PATH", "/nonexistent"}};
    Session session(table, options, logs.logger());
    start(session);

    EXPECT_EQ(read_to_eof(from_session.read_fd), "");
    EXPECT_EQ(finish().outcome, SessionOutcome::SpawnFailed);
}

TEST_F(SessionTest, CallerClosingFirstTerminatesBackend)
{
    RouteTable table;
    // Ignores its input, so only SIGTERM ends it
    table.default_server = make_shell_server("sleeper", "echo $$; exec sleep 30");

    Session session(table, make_options(), logs.logger());
    start(session);

    std::string pid_line = read_line(from_session.read_fd);
    ASSERT_FALSE(pid_line.empty());
    int pid = std::stoi(pid_line);
    EXPECT_TRUE(process_exists(pid));

    to_session.close_write();
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::Clean);
    ASSERT_TRUE(r.exit_status.has_value());
    EXPECT_EQ(r.exit_status->signal, SIGTERM);
    EXPECT_FALSE(process_exists(pid));
    EXPECT_TRUE(logs.contains("sent SIGTERM"));
}

TEST_F(SessionTest, BackendIgnoringTerminateIsKilled)
{
    RouteTable table;
    table.default_server = make_shell_server(
        "stubborn", "trap '' TERM; echo $$; while :; do sleep 1; done");

    Session session(table, make_options(), logs.logger());
    start(session);

    std::string pid_line = read_line(from_session.read_fd);
    ASSERT_FALSE(pid_line.empty());
    int pid = std::stoi(pid_line);

    to_session.close_write();
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::Clean);
    EXPECT_EQ(r.final_state, SessionState::Terminated);
    ASSERT_TRUE(r.exit_status.has_value());
    EXPECT_EQ(r.exit_status->signal, SIGKILL);
    EXPECT_FALSE(process_exists(pid));
    EXPECT_GE(logs.count(LogLevel::Warning), 1u);
}

TEST_F(SessionTest, ClosedCallerOutputIsStreamFailed)
{
    RouteTable table;
    table.default_server = make_shell_server("talker", "echo hello; exec sleep 30");

    from_session.close_read();
    Session session(table, make_options(), logs.logger());
    start(session);
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::StreamFailed);
    EXPECT_EQ(r.exit_code(), 74);
    EXPECT_FALSE(r.error.empty());
    ASSERT_TRUE(r.exit_status.has_value());
    EXPECT_THROW(r.raise_for_outcome(), StreamError);
}

TEST_F(SessionTest, InterruptShutsDownCleanly)
{
    Session session(echo_table(), make_options(), logs.logger());
    start(session);

    const std::string request = "ping\n";
    ASSERT_TRUE(write_fully(to_session.write_fd, request));
    EXPECT_EQ(read_bytes(from_session.read_fd, request.size()), request);

    session.interrupt();
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::Clean);
    EXPECT_EQ(r.final_state, SessionState::Terminated);
    ASSERT_TRUE(r.exit_status.has_value());
    // cat exits on the EOF delivered by shutdown
    EXPECT_TRUE(r.exit_status->success());
    EXPECT_EQ(read_to_eof(from_session.read_fd), "");
}

TEST_F(SessionTest, InterruptBeforeRunSkipsSpawn)
{
    Session session(echo_table(), make_options(), logs.logger());
    session.interrupt();

    SessionResult r = session.run();
    EXPECT_EQ(r.outcome, SessionOutcome::Clean);
    EXPECT_EQ(r.final_state, SessionState::Terminated);
    EXPECT_FALSE(r.exit_status.has_value());
    ASSERT_TRUE(r.target.has_value());
    EXPECT_EQ(r.target->name, "echo");
}

TEST_F(SessionTest, RunTwiceThrows)
{
    Session session(echo_table(), make_options(), logs.logger());
    session.interrupt();
    session.run();
    EXPECT_THROW(session.run(), std::logic_error);
}

TEST_F(SessionTest, IntegrityPinMismatchRefusesSpawn)
{
    RouteTable table = echo_table();
    table.default_server.sha256 = std::string(64, '0');

    Session session(table, make_options(), logs.logger());
    start(session);
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::SpawnFailed);
    EXPECT_NE(r.error.find("hash mismatch"), std::string::npos);
}

TEST_F(SessionTest, AllowedCommandsRejectsOthers)
{
    SessionOptions options = make_options();
    options.allowed_commands = {"/nonexistent/allowed-server"};

    Session session(echo_table(), options, logs.logger());
    start(session);
    SessionResult r = finish();

    EXPECT_EQ(r.outcome, SessionOutcome::SpawnFailed);
    EXPECT_NE(r.error.find("allowed_commands"), std::string::npos);
}

TEST_F(SessionTest, ClosedCallerDescriptorIsRejected)
{
    // All pipes up front so no closed number is handed out again
    TestPipe input;
    TestPipe output;
    TestPipe spare;

    SessionOptions closed_input;
    closed_input.caller_input_fd = input.release_read();
    ::close(closed_input.caller_input_fd);
    closed_input.caller_output_fd = output.release_write();
    EXPECT_THROW({ Session session(echo_table(), closed_input, logs.logger()); }, StreamError);
    ::close(closed_input.caller_output_fd);

    SessionOptions closed_output;
    closed_output.caller_input_fd = spare.release_read();
    closed_output.caller_output_fd = closed_input.caller_output_fd;
    // The input descriptor adopted before the failure is closed again
    EXPECT_THROW({ Session session(echo_table(), closed_output, logs.logger()); }, StreamError);
    EXPECT_EQ(::fcntl(closed_output.caller_input_fd, F_GETFD), -1);
}

TEST(SessionOutcomeTest, ExitCodes)
{
    EXPECT_EQ(exit_code_for(SessionOutcome::Clean), 0);
    EXPECT_EQ(exit_code_for(SessionOutcome::SpawnFailed), 69);
    EXPECT_EQ(exit_code_for(SessionOutcome::StreamFailed), 74);
    EXPECT_EQ(exit_code_for(SessionOutcome::BackendFailed), 70);
}

TEST(SessionOutcomeTest, StateNames)
{
    EXPECT_STREQ(to_string(SessionState::Init), "INIT");
    EXPECT_STREQ(to_string(SessionState::ClosingClean), "CLOSING_CLEAN");
    EXPECT_STREQ(to_string(SessionState::Terminated), "TERMINATED");
}
