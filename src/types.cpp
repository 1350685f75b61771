#include <cstring>
#include <dispatcher/types.hpp>

namespace dispatcher
{

std::string ServerSpec::command_line() const
{
    std::string result = command;
    for (const auto& arg : args)
        result += " " + arg;
    return result;
}

json ServerSpec::to_json() const
{
    json result = {{"name", name}, {"command", command}, {"args", args}};

    if (!env.empty())
        result["env"] = env;
    if (!description.empty())
        result["description"] = description;
    if (cwd.has_value())
        result["cwd"] = *cwd;
    if (sha256.has_value())
        result["sha256"] = *sha256;

    return result;
}

ServerSpec ServerSpec::from_json(const json& j)
{
    ServerSpec spec;
    spec.name = j.at("name").get<std::string>();
    spec.command = j.at("command").get<std::string>();
    spec.args = j.at("args").get<std::vector<std::string>>();

    if (j.contains("env") && !j["env"].is_null())
        spec.env = j["env"].get<Environment>();
    if (j.contains("description") && j["description"].is_string())
        spec.description = j["description"].get<std::string>();
    if (j.contains("cwd") && j["cwd"].is_string())
        spec.cwd = j["cwd"].get<std::string>();
    if (j.contains("sha256") && j["sha256"].is_string())
        spec.sha256 = j["sha256"].get<std::string>();

    return spec;
}

bool ServerSpec::operator==(const ServerSpec& other) const
{
    return name == other.name && command == other.command && args == other.args &&
           env == other.env && description == other.description && cwd == other.cwd &&
           sha256 == other.sha256;
}

std::string ExitStatus::describe() const
{
    if (lost)
        return "unknown status (reaped elsewhere)";
    if (signaled())
    {
        std::string result = "signal " + std::to_string(signal);
        if (const char* name = strsignal(signal))
            result += std::string(" (") + name + ")";
        return result;
    }
    return "exit code " + std::to_string(code);
}

} // namespace dispatcher
