#include "router.hpp"
#include "mcp_client.hpp"
#include <iostream>
#include <stdexcept>

namespace mcpharbor {

std::string namespaced_tool_name(const std::string& ns, const std::string& tool) {
    return ns + "_" + tool;
}

McpRouter::McpRouter(int request_timeout_seconds) : timeout_(request_timeout_seconds) {}

McpRouter::~McpRouter() {
    unmount_all();
}

std::vector<ToolDescriptor> McpRouter::mount(const std::string& ns, const LaunchConfig& config) {
    auto client = std::make_shared<McpClient>(ns, config, timeout_);
    if (!client->connect()) {
        throw std::runtime_error("MCP server " + ns + " failed to start (" + config.key + ")");
    }

    Mount m;
    m.client = client;
    m.tools = client->list_tools();
    if (m.tools.empty()) {
        std::cerr << "[router] " << ns << " reported no tools\n";
    }

    std::vector<ToolDescriptor> exposed;
    for (auto& t : m.tools) {
        ToolDescriptor d = t;
        d.name = namespaced_tool_name(ns, t.name);
        exposed.push_back(std::move(d));
    }

    std::shared_ptr<McpClient> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mounts_.find(ns);
        if (it != mounts_.end()) previous = it->second.client;
        mounts_[ns] = std::move(m);
    }
    if (previous) previous->disconnect();

    std::cerr << "[router] Mounted " << ns << " with " << exposed.size() << " tools\n";
    return exposed;
}

bool McpRouter::unmount(const std::string& ns) {
    std::shared_ptr<McpClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mounts_.find(ns);
        if (it == mounts_.end()) return false;
        client = it->second.client;
        mounts_.erase(it);
    }
    client->disconnect();
    std::cerr << "[router] Unmounted " << ns << "\n";
    return true;
}

std::vector<UpstreamTool> McpRouter::list_tools() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UpstreamTool> out;
    for (auto& [ns, m] : mounts_) {
        for (auto& t : m.tools) {
            ToolDescriptor d = t;
            d.name = namespaced_tool_name(ns, t.name);
            out.emplace_back(std::move(d));
        }
    }
    return out;
}

nlohmann::json McpRouter::call_tool(const std::string& name, const nlohmann::json& args) {
    std::shared_ptr<McpClient> client;
    std::string upstream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Namespaces may themselves contain '_', so match against known mounts
        for (auto& [ns, m] : mounts_) {
            std::string prefix = ns + "_";
            if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) continue;
            std::string rest = name.substr(prefix.size());
            for (auto& t : m.tools) {
                if (t.name == rest) {
                    client = m.client;
                    upstream = rest;
                    break;
                }
            }
            if (client) break;
        }
    }
    if (!client) throw std::out_of_range("Unknown tool: " + name);
    return client->call_tool(upstream, args);
}

std::vector<std::string> McpRouter::mounted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (auto& [ns, m] : mounts_) names.push_back(ns);
    return names;
}

void McpRouter::unmount_all() {
    std::map<std::string, Mount> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(mounts_);
    }
    for (auto& [ns, m] : all) m.client->disconnect();
}

} // namespace mcpharbor
