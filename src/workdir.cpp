#include <dispatcher/workdir.hpp>
#include <filesystem>

extern char** environ;

namespace dispatcher
{

const char* to_string(WorkdirSource source)
{
    switch (source)
    {
    case WorkdirSource::Explicit:
        return "explicit";
    case WorkdirSource::Environment:
        return "environment";
    case WorkdirSource::ProcessCwd:
        return "process cwd";
    }
    return "unknown";
}

const std::vector<std::string>& default_workdir_variables()
{
    static const std::vector<std::string> variables = {WORKDIR_ENV_VAR, "PWD"};
    return variables;
}

Environment capture_environment()
{
    Environment env;
    if (!environ)
        return env;

    for (char** entry = environ; *entry; ++entry)
    {
        std::string item(*entry);
        auto eq = item.find('=');
        if (eq != std::string::npos && eq > 0)
            env.emplace(item.substr(0, eq), item.substr(eq + 1));
    }
    return env;
}

namespace
{
std::string make_absolute(const std::string& path)
{
    namespace fs = std::filesystem;
    fs::path p(path);
    if (p.is_absolute())
        return path;

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec)
        return path;
    return (cwd / p).string();
}
} // namespace

WorkdirHint resolve_workdir_hint(const std::optional<std::string>& explicit_dir,
                                 const Environment& env,
                                 const std::vector<std::string>& override_vars)
{
    WorkdirHint hint;

    if (explicit_dir && !explicit_dir->empty())
    {
        hint.path = make_absolute(*explicit_dir);
        hint.source = WorkdirSource::Explicit;
        return hint;
    }

    for (const auto& name : override_vars)
    {
        auto it = env.find(name);
        if (it != env.end() && !it->second.empty())
        {
            hint.path = make_absolute(it->second);
            hint.source = WorkdirSource::Environment;
            hint.variable = name;
            return hint;
        }
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    hint.path = ec ? std::string(".") : cwd.string();
    hint.source = WorkdirSource::ProcessCwd;
    return hint;
}

} // namespace dispatcher
