/**
 * @file route_explain.cpp
 * @brief Dry-run routing against an in-memory route table
 *
 * Demonstrates:
 * - Building a RouteTable in code
 * - explain() to see which rule (if any) selected a server
 * - First match wins: order, not specificity, decides ties
 *
 * Usage: route_explain [PATH...]
 */

#include <dispatcher/dispatcher.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace
{

dispatcher::ServerSpec make_server(const std::string& name, const std::string& command,
                                   std::vector<std::string> args)
{
    dispatcher::ServerSpec server;
    server.name = name;
    server.command = command;
    server.args = std::move(args);
    return server;
}

} // namespace

int main(int argc, char* argv[])
{
    dispatcher::RouteTable table;
    table.rules.push_back({"/home/*/projects/web*", make_server("web", "node", {"web.js"})});
    // Never selected for /home/*/projects/web-api: the rule above comes first
    table.rules.push_back({"/home/*/projects/web-api*", make_server("api", "node", {"api.js"})});
    table.rules.push_back({"/srv/data/[!.]*", make_server("data", "uvx", {"mcp-server-sqlite"})});
    table.default_server = make_server("fallback", "uvx", {"mcp-server-fetch"});

    std::vector<std::string> paths(argv + 1, argv + argc);
    if (paths.empty())
        paths = {"/home/alice/projects/web-app", "/home/alice/projects/web-api/",
                 "/home/alice/projects/api", "/srv/data/../data/sales", "C:\\Users\\bob"};

    for (const auto& path : paths)
    {
        dispatcher::RouteMatch match = dispatcher::explain(path, table);

        std::cout << path << "\n";
        std::cout << "  key:    " << match.normalized_path << "\n";
        if (match.is_default())
            std::cout << "  rule:   (default)\n";
        else
            std::cout << "  rule:   #" << *match.rule_index << " " << match.pattern << "\n";
        std::cout << "  server: " << match.target.name << " -> " << match.target.command_line()
                  << "\n";
    }

    return 0;
}
