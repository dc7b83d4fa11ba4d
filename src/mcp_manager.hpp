#pragma once
#include "router.hpp"
#include "store.hpp"
#include <string>
#include <vector>
#include <iostream>

namespace mcpharbor {

// Mounts servers on the router and keeps their tool rows in the store.
class McpManager {
public:
    McpManager(Router& router, Store& store) : router_(router), store_(store) {}

    // Registers the server under its id and persists the tools it reports.
    // Launch failures propagate; a server that starts but cannot be
    // introspected yields an empty list.
    std::vector<ToolDescriptor> add_server(const Server& server, const LaunchConfig& config) {
        std::vector<ToolDescriptor> discovered = router_.mount(server.id, config);
        if (discovered.empty()) {
            std::cerr << "[mcp] " << server.name << " mounted without tools\n";
            return discovered;
        }

        std::vector<Tool> rows;
        rows.reserve(discovered.size());
        for (auto& d : discovered) {
            Tool t;
            t.server_id = server.id;
            t.tool_name = d.name;
            t.description = d.description;
            t.schema = d.input_schema;
            rows.push_back(std::move(t));
        }
        size_t stored = store_.store_server_tools(server.id, rows);
        std::cerr << "[mcp] " << server.name << ": stored " << stored << " tools\n";
        return discovered;
    }

    bool remove_server(const std::string& server_id) {
        bool removed = router_.unmount(server_id);
        if (removed) std::cerr << "[mcp] Removed server: " << server_id << "\n";
        return removed;
    }

    size_t server_count() const { return router_.mounted().size(); }
    std::vector<std::string> server_ids() const { return router_.mounted(); }

    Router& router() { return router_; }

private:
    Router& router_;
    Store& store_;
};

} // namespace mcpharbor
