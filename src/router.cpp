#include <algorithm>
#include <dispatcher/router.hpp>
#include <fnmatch.h>
#include <vector>

namespace dispatcher
{

std::string normalize_path(const std::string& path)
{
    std::string unified = path;
    std::replace(unified.begin(), unified.end(), '\\', '/');

    const bool absolute = !unified.empty() && unified.front() == '/';

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= unified.size())
    {
        size_t end = unified.find('/', start);
        if (end == std::string::npos)
            end = unified.size();

        std::string segment = unified.substr(start, end - start);
        if (segment.empty() || segment == ".")
        {
            // Repeated separator or current directory
        }
        else if (segment == "..")
        {
            if (!segments.empty() && segments.back() != "..")
                segments.pop_back();
            else if (!absolute)
                segments.push_back(segment); // ".." above the root is dropped
        }
        else
        {
            segments.push_back(segment);
        }

        start = end + 1;
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i)
    {
        if (i > 0)
            result += "/";
        result += segments[i];
    }

    if (result.empty())
        return ".";
    return result;
}

bool glob_match(const std::string& pattern, const std::string& path)
{
    // No FNM_PATHNAME: '*' crosses separators, so "/a/b*" also covers "/a/b/c".
    // FNM_NOESCAPE keeps backslash literal.
    return ::fnmatch(pattern.c_str(), path.c_str(), FNM_NOESCAPE) == 0;
}

RouteMatch explain(const std::string& path, const RouteTable& table)
{
    RouteMatch match;
    match.normalized_path = normalize_path(path);

    for (size_t i = 0; i < table.rules.size(); ++i)
    {
        const auto& rule = table.rules[i];

        std::string pattern = rule.pattern;
        std::replace(pattern.begin(), pattern.end(), '\\', '/');

        if (glob_match(pattern, match.normalized_path))
        {
            match.target = rule.target;
            match.rule_index = i;
            match.pattern = rule.pattern;
            return match;
        }
    }

    match.target = table.default_server;
    return match;
}

ServerSpec resolve(const std::string& path, const RouteTable& table)
{
    return explain(path, table).target;
}

} // namespace dispatcher
