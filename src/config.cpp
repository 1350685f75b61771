#include <dispatcher/config.hpp>
#include <dispatcher/errors.hpp>
#include <dispatcher/logging.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace dispatcher
{

namespace
{
constexpr const char* CONFIG_DIR_NAME = "mcp_dispatcher";
constexpr const char* CONFIG_FILE_NAME = "config.json";

std::string env_value(const Environment& env, const std::string& name)
{
    auto it = env.find(name);
    return it != env.end() ? it->second : std::string();
}

bool is_string_array(const json& j)
{
    if (!j.is_array())
        return false;
    for (const auto& item : j)
        if (!item.is_string())
            return false;
    return true;
}

void validate_server(const json& server, const std::string& where,
                     std::vector<std::string>& problems)
{
    if (!server.is_object())
    {
        problems.push_back(where + " must be an object");
        return;
    }

    for (const char* key : {"name", "command"})
    {
        if (!server.contains(key))
            problems.push_back(where + " missing '" + key + "'");
        else if (!server[key].is_string())
            problems.push_back(where + "." + key + " must be a string");
        else if (server[key].get<std::string>().empty())
            problems.push_back(where + "." + key + " must not be empty");
    }

    if (!server.contains("args"))
        problems.push_back(where + " missing 'args'");
    else if (!is_string_array(server["args"]))
        problems.push_back(where + ".args must be an array of strings");

    if (server.contains("env") && !server["env"].is_null())
    {
        const auto& env = server["env"];
        if (!env.is_object())
        {
            problems.push_back(where + ".env must be an object");
        }
        else
        {
            for (auto it = env.begin(); it != env.end(); ++it)
                if (!it.value().is_string())
                    problems.push_back(where + ".env." + it.key() + " must be a string");
        }
    }

    for (const char* key : {"description", "cwd", "sha256"})
        if (server.contains(key) && !server[key].is_null() && !server[key].is_string())
            problems.push_back(where + "." + key + " must be a string");
}

std::string format_problems(const std::string& heading, const std::vector<std::string>& problems)
{
    std::ostringstream oss;
    oss << heading;
    for (const auto& problem : problems)
        oss << "\n   - " << problem;
    return oss.str();
}

json parse_json_file(const std::string& path)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path, ec))
        throw ConfigurationError(missing_config_help(path));

    std::ifstream file(path);
    if (!file)
        throw ConfigurationError("Error loading config file '" + path + "': cannot open file");

    try
    {
        return json::parse(file);
    }
    catch (const json::parse_error& e)
    {
        throw ConfigurationError("Error loading config file '" + path + "': " + e.what() +
                                 "\nPlease check your configuration file syntax and try again.");
    }
}
} // namespace

std::string default_config_path(const Environment& env)
{
    namespace fs = std::filesystem;
    const std::string home = env_value(env, "HOME");

#ifdef __APPLE__
    fs::path base = fs::path(home) / "Library" / "Application Support";
#else
    const std::string xdg = env_value(env, "XDG_CONFIG_HOME");
    fs::path base = !xdg.empty() ? fs::path(xdg) : fs::path(home) / ".config";
#endif

    return (base / CONFIG_DIR_NAME / CONFIG_FILE_NAME).string();
}

std::string find_config_file(const std::optional<std::string>& explicit_path,
                             const Environment& env)
{
    if (explicit_path && !explicit_path->empty())
        return *explicit_path;

    const std::string from_env = env_value(env, CONFIG_ENV_VAR);
    if (!from_env.empty())
        return from_env;

    std::error_code ec;
    if (std::filesystem::exists(CONFIG_FILE_NAME, ec))
        return CONFIG_FILE_NAME;

    return default_config_path(env);
}

std::vector<std::string> validate_config(const json& j)
{
    std::vector<std::string> problems;

    if (!j.is_object())
    {
        problems.push_back("Configuration must be a JSON object");
        return problems;
    }

    if (!j.contains("default_mcp_server"))
        problems.push_back("Missing 'default_mcp_server' configuration");
    else
        validate_server(j["default_mcp_server"], "default_mcp_server", problems);

    // An absent or empty list routes every path to the default
    if (j.contains("path_mappings"))
    {
        const auto& mappings = j["path_mappings"];
        if (!mappings.is_array())
        {
            problems.push_back("'path_mappings' must be an array");
        }
        else
        {
            for (size_t i = 0; i < mappings.size(); ++i)
            {
                const std::string where = "path_mappings[" + std::to_string(i) + "]";
                const auto& mapping = mappings[i];
                if (!mapping.is_object())
                {
                    problems.push_back(where + " must be an object");
                    continue;
                }

                if (!mapping.contains("path_pattern"))
                    problems.push_back(where + " missing 'path_pattern'");
                else if (!mapping["path_pattern"].is_string() ||
                         mapping["path_pattern"].get<std::string>().empty())
                    problems.push_back(where + ".path_pattern must be a non-empty string");

                if (!mapping.contains("mcp_server"))
                    problems.push_back(where + " missing 'mcp_server'");
                else
                    validate_server(mapping["mcp_server"], where + ".mcp_server", problems);
            }
        }
    }

    if (j.contains("log_level"))
    {
        if (!j["log_level"].is_string() ||
            !parse_log_level(j["log_level"].get<std::string>()).has_value())
            problems.push_back("'log_level' must be one of debug, info, warning, error, off");
    }

    if (j.contains("workdir_env") && !is_string_array(j["workdir_env"]))
        problems.push_back("'workdir_env' must be an array of strings");

    if (j.contains("grace_period_ms"))
    {
        const auto& grace = j["grace_period_ms"];
        if (!grace.is_number_integer() || grace.get<long long>() < 0)
            problems.push_back("'grace_period_ms' must be a non-negative integer");
        else if (grace.get<long long>() > MAX_GRACE_PERIOD.count())
            problems.push_back("'grace_period_ms' must not exceed " +
                               std::to_string(MAX_GRACE_PERIOD.count()));
    }

    if (j.contains("allowed_commands") && !is_string_array(j["allowed_commands"]))
        problems.push_back("'allowed_commands' must be an array of strings");

    return problems;
}

DispatcherConfig parse_config(const json& j)
{
    auto problems = validate_config(j);
    if (!problems.empty())
        throw ConfigurationError(format_problems("Configuration validation failed:", problems),
                                 problems);

    DispatcherConfig config;
    config.routes.default_server = ServerSpec::from_json(j["default_mcp_server"]);

    if (j.contains("path_mappings"))
    {
        for (const auto& mapping : j["path_mappings"])
        {
            RouteRule rule;
            rule.pattern = mapping["path_pattern"].get<std::string>();
            rule.target = ServerSpec::from_json(mapping["mcp_server"]);
            config.routes.rules.push_back(std::move(rule));
        }
    }

    if (j.contains("log_level"))
        config.log_level = j["log_level"].get<std::string>();
    if (j.contains("workdir_env"))
        config.workdir_env = j["workdir_env"].get<std::vector<std::string>>();
    if (j.contains("grace_period_ms"))
        config.grace_period = std::chrono::milliseconds(j["grace_period_ms"].get<long long>());
    if (j.contains("allowed_commands"))
        config.allowed_commands = j["allowed_commands"].get<std::vector<std::string>>();

    return config;
}

DispatcherConfig load_config(const std::string& path)
{
    json document = parse_json_file(path);
    try
    {
        return parse_config(document);
    }
    catch (const ConfigurationError& e)
    {
        throw ConfigurationError("Invalid config file '" + path + "': " + e.what(),
                                 e.problems());
    }
}

json read_config_json(const std::string& path)
{
    return parse_json_file(path);
}

void write_config_json(const std::string& path, const json& j)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
    {
        fs::create_directories(parent, ec);
        if (ec)
            throw ConfigurationError("Error saving config '" + path + "': " + ec.message());
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file)
        throw ConfigurationError("Error saving config '" + path + "': cannot open for writing");

    file << j.dump(2) << '\n';
    file.close();
    if (!file)
        throw ConfigurationError("Error saving config '" + path + "': write failed");
}

void add_path_mapping(json& config, const std::string& pattern, const ServerSpec& server)
{
    if (!config.contains("path_mappings") || !config["path_mappings"].is_array())
        config["path_mappings"] = json::array();

    config["path_mappings"].push_back({{"path_pattern", pattern}, {"mcp_server", server.to_json()}});
}

size_t remove_path_mapping(json& config, const std::string& pattern)
{
    if (!config.contains("path_mappings") || !config["path_mappings"].is_array())
        return 0;

    json kept = json::array();
    size_t removed = 0;
    for (const auto& mapping : config["path_mappings"])
    {
        if (mapping.is_object() && mapping.contains("path_pattern") &&
            mapping["path_pattern"] == pattern)
        {
            ++removed;
            continue;
        }
        kept.push_back(mapping);
    }

    config["path_mappings"] = std::move(kept);
    return removed;
}

std::string missing_config_help(const std::string& expected_path)
{
    std::ostringstream oss;
    oss << "Configuration file not found!\n"
        << "Expected location: " << expected_path << "\n\n"
        << "To get started:\n"
        << "  1. Set " << CONFIG_ENV_VAR << " to the path of your config file, or\n"
        << "  2. Create " << expected_path << " with at least a 'default_mcp_server'\n"
        << "     entry and your 'path_mappings'\n\n"
        << "Example:\n"
        << "  {\n"
        << "    \"path_mappings\": [\n"
        << "      {\"path_pattern\": \"/home/*/projects/web*\",\n"
        << "       \"mcp_server\": {\"name\": \"web\", \"command\": \"node\", \"args\": "
           "[\"server.js\"]}}\n"
        << "    ],\n"
        << "    \"default_mcp_server\": {\"name\": \"default\", \"command\": \"uvx\", "
           "\"args\": [\"mcp-server-fetch\"]}\n"
        << "  }";
    return oss.str();
}

} // namespace dispatcher
