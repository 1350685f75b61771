#ifndef DISPATCHER_ROUTER_HPP
#define DISPATCHER_ROUTER_HPP

#include <dispatcher/types.hpp>
#include <optional>
#include <string>

namespace dispatcher
{

/**
 * Outcome of routing one path, with enough detail for dry-run reporting.
 */
struct RouteMatch
{
    ServerSpec target;
    std::string normalized_path;
    std::optional<size_t> rule_index; // Index into RouteTable::rules, nullopt for the default
    std::string pattern;              // Pattern of the matching rule, empty for the default

    bool is_default() const
    {
        return !rule_index.has_value();
    }
};

/**
 * Canonical separator form used as the routing key.
 *
 * Backslashes become '/', repeated separators collapse, "." and ".." segments
 * are resolved lexically and a trailing separator is dropped (except for the
 * root). Symlinks are not followed.
 */
std::string normalize_path(const std::string& path);

/**
 * Shell glob match: '*', '?', "[seq]" and "[!seq]". '*' also matches '/',
 * backslash is literal, matching is case-sensitive. Braces are not expanded.
 */
bool glob_match(const std::string& pattern, const std::string& path);

/**
 * First rule (in stored order) whose pattern matches the normalized path,
 * falling back to the table default. Never fails and has no side effects.
 */
RouteMatch explain(const std::string& path, const RouteTable& table);

/// explain(path, table).target
ServerSpec resolve(const std::string& path, const RouteTable& table);

} // namespace dispatcher

#endif // DISPATCHER_ROUTER_HPP
