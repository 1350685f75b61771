/**
 * @file embedded_session.cpp
 * @brief Running a Session over in-process pipes
 *
 * Demonstrates:
 * - Handing a Session caller descriptors other than stdin/stdout
 * - Capturing log records with a LogCallback
 * - Turning a failed SessionResult into the matching exception
 *
 * The backend here is /bin/cat, so every request comes straight back.
 */

#include <cstdio>
#include <dispatcher/dispatcher.hpp>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

int main()
{
    dispatcher::RouteTable table;
    table.default_server.name = "echo";
    table.default_server.command = "/bin/cat";

    // to_session: we write, the session reads. from_session: the reverse.
    int to_session[2];
    int from_session[2];
    if (::pipe2(to_session, O_CLOEXEC) != 0 || ::pipe2(from_session, O_CLOEXEC) != 0)
    {
        std::perror("pipe2");
        return 1;
    }

    dispatcher::SessionOptions options;
    options.workdir = "/tmp";
    options.caller_input_fd = to_session[0];
    options.caller_output_fd = from_session[1];

    dispatcher::Logger logger(dispatcher::LogLevel::Debug,
                              [](dispatcher::LogLevel level, const std::string& message)
                              { std::cerr << "[" << dispatcher::to_string(level) << "] "
                                          << message << "\n"; });

    dispatcher::Session session(table, options, logger);
    dispatcher::SessionResult result;
    std::thread runner([&] { result = session.run(); });

    const std::string request = R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                                "\n";
    if (::write(to_session[1], request.data(), request.size()) < 0)
        std::perror("write");
    ::close(to_session[1]);

    std::string echoed;
    char buffer[256];
    ssize_t n;
    while ((n = ::read(from_session[0], buffer, sizeof(buffer))) > 0)
        echoed.append(buffer, static_cast<size_t>(n));
    ::close(from_session[0]);

    runner.join();

    std::cout << "Echoed: " << echoed;
    std::cout << "Outcome: " << dispatcher::to_string(result.outcome) << ", "
              << result.bytes_to_backend << " bytes in, " << result.bytes_from_backend
              << " bytes out\n";

    try
    {
        result.raise_for_outcome();
    }
    catch (const dispatcher::SpawnError& e)
    {
        std::cerr << "Backend could not start: " << e.what() << "\n";
        return 1;
    }
    catch (const dispatcher::ChildExitError& e)
    {
        std::cerr << "Backend failed (exit " << e.exit_code() << "): " << e.what() << "\n";
        return 1;
    }
    catch (const dispatcher::DispatcherError& e)
    {
        std::cerr << "Session failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
