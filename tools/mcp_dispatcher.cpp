/**
 * mcp_dispatcher.cpp - stdio entry point
 *
 * Runs one dispatch session on this process's stdin/stdout, or manages the
 * path mappings in the configuration file.
 *
 *   mcp-dispatcher [--config FILE] [--log-level LEVEL] [command]
 *
 *   serve [--workdir DIR]       Route and relay (default)
 *   test [--path DIR]           Show which server a directory routes to
 *   list                        Show all path mappings
 *   add PATTERN NAME COMMAND [ARGS...] [--description TEXT]
 *   remove PATTERN
 *   version
 */

#include <atomic>
#include <csignal>
#include <cstring>
#include <dispatcher/dispatcher.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace dispatcher;

namespace
{

constexpr int EXIT_USAGE = 64;  // EX_USAGE
constexpr int EXIT_CONFIG = 78; // EX_CONFIG

constexpr const char* LOG_LEVEL_ENV_VAR = "MCP_DISPATCHER_LOG_LEVEL";

std::atomic<Session*> g_active_session{nullptr};

extern "C" void handle_shutdown_signal(int)
{
    Session* session = g_active_session.load();
    if (session)
        session->interrupt();
}

struct CommandLine
{
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::string command = "serve";
    std::vector<std::string> args;
};

class UsageError : public std::runtime_error
{
  public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void print_usage(std::ostream& out)
{
    out << "Usage: mcp-dispatcher [--config FILE] [--log-level LEVEL] [command]\n"
        << "\n"
        << "Commands:\n"
        << "  serve [--workdir DIR]     Route to an MCP server and relay stdio (default)\n"
        << "  test [--path DIR]         Show which server a directory routes to\n"
        << "  list                      Show all path mappings\n"
        << "  add PATTERN NAME COMMAND [ARGS...] [--description TEXT]\n"
        << "                            Add a path mapping\n"
        << "  remove PATTERN            Remove path mappings with this pattern\n"
        << "  version                   Print the version\n"
        << "\n"
        << "Environment:\n"
        << "  " << CONFIG_ENV_VAR << "     Configuration file\n"
        << "  " << LOG_LEVEL_ENV_VAR << "  debug, info, warning, error or off\n"
        << "  " << WORKDIR_ENV_VAR << "        Working directory used for routing\n";
}

// Value of "--name VALUE" or "--name=VALUE" at args[i]; advances i past it
std::optional<std::string> take_option(const std::vector<std::string>& args, size_t& i,
                                       const std::string& name)
{
    const std::string& arg = args[i];
    if (arg == name)
    {
        if (i + 1 >= args.size())
            throw UsageError("Option " + name + " requires a value");
        ++i;
        return args[i];
    }
    if (arg.compare(0, name.size() + 1, name + "=") == 0)
        return arg.substr(name.size() + 1);
    return std::nullopt;
}

CommandLine parse_command_line(int argc, char* argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    CommandLine cmd;

    size_t i = 0;
    for (; i < args.size(); ++i)
    {
        if (auto value = take_option(args, i, "--config"))
            cmd.config_path = *value;
        else if (auto level = take_option(args, i, "--log-level"))
            cmd.log_level = *level;
        else if (args[i] == "-h" || args[i] == "--help")
            cmd.command = "help";
        else if (!args[i].empty() && args[i][0] == '-')
            throw UsageError("Unknown option: " + args[i]);
        else
            break;
    }

    if (cmd.command == "help")
        return cmd;

    if (i < args.size())
        cmd.command = args[i++];
    cmd.args.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    return cmd;
}

Logger make_logger(const CommandLine& cmd, const Environment& env,
                   const std::optional<std::string>& config_level)
{
    std::optional<std::string> text = cmd.log_level;
    if (!text)
    {
        auto it = env.find(LOG_LEVEL_ENV_VAR);
        if (it != env.end() && !it->second.empty())
            text = it->second;
    }
    if (!text)
        text = config_level;
    if (!text)
        return Logger(LogLevel::Info);

    auto level = parse_log_level(*text);
    if (!level)
        throw UsageError("Invalid log level: " + *text);
    return Logger(*level);
}

void install_signal_handlers()
{
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_shutdown_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGHUP, &action, nullptr);

    // A vanished client shows up as EPIPE on the relay, not a fatal signal
    std::signal(SIGPIPE, SIG_IGN);

    // Inherited SIG_IGN would let the kernel discard the backend's exit status
    std::signal(SIGCHLD, SIG_DFL);
}

void print_server(std::ostream& out, const ServerSpec& server, const std::string& indent)
{
    out << indent << "Server:  " << server.name << "\n";
    out << indent << "Command: " << server.command_line() << "\n";
    if (!server.description.empty())
        out << indent << "Description: " << server.description << "\n";
    if (server.cwd)
        out << indent << "Cwd:     " << *server.cwd << "\n";
}

int run_serve(const CommandLine& cmd, const Environment& env)
{
    std::optional<std::string> workdir;
    for (size_t i = 0; i < cmd.args.size(); ++i)
    {
        if (auto value = take_option(cmd.args, i, "--workdir"))
            workdir = *value;
        else
            throw UsageError("Unexpected argument for serve: " + cmd.args[i]);
    }

    DispatcherConfig config = load_config(find_config_file(cmd.config_path, env));
    Logger logger = make_logger(cmd, env, config.log_level);

    SessionOptions options;
    options.workdir = workdir;
    if (!config.workdir_env.empty())
        options.workdir_env = config.workdir_env;
    options.environment = env;
    options.grace_period = config.grace_period;
    options.allowed_commands = config.allowed_commands;

    logger.info("MCP dispatcher " + version_string() + " starting");

    Session session(std::move(config.routes), std::move(options), logger);
    g_active_session.store(&session);
    install_signal_handlers();

    SessionResult result = session.run();
    g_active_session.store(nullptr);
    return result.exit_code();
}

int run_test(const CommandLine& cmd, const Environment& env)
{
    std::optional<std::string> path;
    for (size_t i = 0; i < cmd.args.size(); ++i)
    {
        if (auto value = take_option(cmd.args, i, "--path"))
            path = *value;
        else
            throw UsageError("Unexpected argument for test: " + cmd.args[i]);
    }

    DispatcherConfig config = load_config(find_config_file(cmd.config_path, env));
    const auto& vars = config.workdir_env.empty() ? default_workdir_variables() : config.workdir_env;
    WorkdirHint hint = resolve_workdir_hint(path, env, vars);
    RouteMatch match = explain(hint.path, config.routes);

    std::cout << "Path:    " << hint.path << " (" << to_string(hint.source) << ")\n";
    std::cout << "Routing key: " << match.normalized_path << "\n";
    if (match.is_default())
        std::cout << "Match:   no pattern matched, using default\n";
    else
        std::cout << "Match:   '" << match.pattern << "' (mapping " << *match.rule_index + 1
                  << ")\n";
    print_server(std::cout, match.target, "");
    return 0;
}

int run_list(const CommandLine& cmd, const Environment& env)
{
    if (!cmd.args.empty())
        throw UsageError("Unexpected argument for list: " + cmd.args.front());

    const std::string path = find_config_file(cmd.config_path, env);
    DispatcherConfig config = load_config(path);

    std::cout << "Configuration: " << path << "\n\n";
    if (config.routes.rules.empty())
        std::cout << "No path mappings configured.\n";

    for (size_t i = 0; i < config.routes.rules.size(); ++i)
    {
        const auto& rule = config.routes.rules[i];
        std::cout << i + 1 << ". " << rule.pattern << "\n";
        print_server(std::cout, rule.target, "   ");
        std::cout << "\n";
    }

    std::cout << "Default:\n";
    print_server(std::cout, config.routes.default_server, "   ");
    return 0;
}

int run_add(const CommandLine& cmd, const Environment& env)
{
    std::vector<std::string> positional;
    std::string description;
    bool options_done = false;
    for (size_t i = 0; i < cmd.args.size(); ++i)
    {
        if (!options_done && cmd.args[i] == "--")
        {
            options_done = true;
            continue;
        }
        if (!options_done)
        {
            if (auto value = take_option(cmd.args, i, "--description"))
            {
                description = *value;
                continue;
            }
        }
        positional.push_back(cmd.args[i]);
    }

    if (positional.size() < 3)
        throw UsageError("add requires PATTERN NAME COMMAND");

    ServerSpec server;
    server.name = positional[1];
    server.command = positional[2];
    server.args.assign(positional.begin() + 3, positional.end());
    server.description = description;

    const std::string path = find_config_file(cmd.config_path, env);
    json document = read_config_json(path);
    add_path_mapping(document, positional[0], server);

    // Refuse to save a document the serve command would reject
    auto problems = validate_config(document);
    if (!problems.empty())
    {
        std::string message = "Configuration would be invalid after adding '" + positional[0] + "':";
        for (const auto& problem : problems)
            message += "\n   - " + problem;
        throw ConfigurationError(message, problems);
    }

    write_config_json(path, document);
    std::cout << "Added mapping: " << positional[0] << " -> " << server.name << "\n";
    return 0;
}

int run_remove(const CommandLine& cmd, const Environment& env)
{
    if (cmd.args.size() != 1)
        throw UsageError("remove requires exactly one PATTERN");

    const std::string& pattern = cmd.args.front();
    const std::string path = find_config_file(cmd.config_path, env);
    json document = read_config_json(path);

    size_t removed = remove_path_mapping(document, pattern);
    if (removed == 0)
    {
        std::cerr << "No mapping found for pattern: " << pattern << "\n";
        return 1;
    }

    write_config_json(path, document);
    std::cout << "Removed " << removed << " mapping(s) for pattern: " << pattern << "\n";
    return 0;
}

void report_configuration_error(const ConfigurationError& e)
{
    std::cerr << "Configuration error: " << e.what() << "\n";
    if (!e.problems().empty())
        std::cerr << "Fix the problems above and try again.\n";
}

} // namespace

int main(int argc, char* argv[])
{
    Environment env = capture_environment();

    CommandLine cmd;
    try
    {
        cmd = parse_command_line(argc, argv);
    }
    catch (const UsageError& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    try
    {
        if (cmd.command == "help")
        {
            print_usage(std::cout);
            return 0;
        }
        if (cmd.command == "version")
        {
            std::cout << "mcp-dispatcher " << version_string() << "\n";
            return 0;
        }
        if (cmd.command == "serve")
            return run_serve(cmd, env);
        if (cmd.command == "test")
            return run_test(cmd, env);
        if (cmd.command == "list")
            return run_list(cmd, env);
        if (cmd.command == "add")
            return run_add(cmd, env);
        if (cmd.command == "remove")
            return run_remove(cmd, env);

        throw UsageError("Unknown command: " + cmd.command);
    }
    catch (const UsageError& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    catch (const ConfigurationError& e)
    {
        report_configuration_error(e);
        return EXIT_CONFIG;
    }
    catch (const DispatcherError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return exit_code_for(SessionOutcome::StreamFailed);
    }
}
