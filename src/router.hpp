#pragma once
#include "mcp_config.hpp"
#include "tool_filter.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

namespace mcpharbor {

class McpClient;

// Merged tool catalog over every mounted server. Tools are exposed as
// "<namespace>_<tool>".
class Router {
public:
    virtual ~Router() = default;

    // Launches and registers the namespace, replacing an existing mount
    // with the same name. Throws std::runtime_error when the process cannot
    // be started or does not complete the MCP handshake. Returns the
    // namespaced tools, empty when introspection fails.
    virtual std::vector<ToolDescriptor> mount(const std::string& ns, const LaunchConfig& config) = 0;
    virtual bool unmount(const std::string& ns) = 0;
    virtual std::vector<UpstreamTool> list_tools() = 0;
    // Throws std::out_of_range for a name no mount owns
    virtual nlohmann::json call_tool(const std::string& name, const nlohmann::json& args) = 0;
    virtual std::vector<std::string> mounted() const = 0;
    virtual void unmount_all() = 0;
};

class McpRouter : public Router {
public:
    explicit McpRouter(int request_timeout_seconds = 60);
    ~McpRouter() override;

    std::vector<ToolDescriptor> mount(const std::string& ns, const LaunchConfig& config) override;
    bool unmount(const std::string& ns) override;
    std::vector<UpstreamTool> list_tools() override;
    nlohmann::json call_tool(const std::string& name, const nlohmann::json& args) override;
    std::vector<std::string> mounted() const override;
    void unmount_all() override;

private:
    struct Mount {
        std::shared_ptr<McpClient> client;
        std::vector<ToolDescriptor> tools;   // upstream names
    };

    int timeout_;
    mutable std::mutex mutex_;
    std::map<std::string, Mount> mounts_;
};

std::string namespaced_tool_name(const std::string& ns, const std::string& tool);

} // namespace mcpharbor
