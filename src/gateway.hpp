#pragma once
#include "config.hpp"
#include "container_manager.hpp"
#include "lifespan.hpp"
#include "mcp_manager.hpp"
#include "store.hpp"
#include "tool_filter.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace mcpharbor {

// MCP endpoint behind the lifespan wrapper: mounts built servers on
// startup, answers JSON-RPC with the per-user filtered catalog.
class HarborApp : public LifespanApp {
public:
    HarborApp(ContainerManager& containers, McpManager& manager, Store& store,
              ToolFilter& filter, std::string user_header);

    void run(LifespanContext& ctx) override;
    void handle(const httplib::Request& req, httplib::Response& res) override;

    // One JSON-RPC message; null for notifications
    nlohmann::json dispatch(const nlohmann::json& msg, std::optional<int64_t> user_id);

    // Mounts built servers not yet on the router and drops mounts whose
    // server is gone or no longer built
    MountReport refresh(const std::function<bool()>& cancelled = nullptr);
    MountReport last_report() const;

    std::optional<int64_t> identity(const httplib::Request& req) const;

private:
    ContainerManager& containers_;
    McpManager& manager_;
    Store& store_;
    ToolFilter& filter_;
    std::string user_header_;

    std::mutex refresh_mutex_;
    mutable std::mutex report_mutex_;
    MountReport last_report_;

    nlohmann::json list_tools(std::optional<int64_t> user_id);
    nlohmann::json call_tool(const nlohmann::json& params, std::optional<int64_t> user_id,
                             const nlohmann::json& id);
};

// HTTP surface: MCP endpoint, health and admin routes.
class Gateway {
public:
    Gateway(const Config& cfg, LifespanWrapper& lifespan, HarborApp& app,
            ContainerManager& containers, McpManager& manager, Store& store);
    ~Gateway();

    void start();
    void stop();

    httplib::Server& server() { return server_; }

private:
    Config config_;
    LifespanWrapper& lifespan_;
    HarborApp& app_;
    ContainerManager& containers_;
    McpManager& manager_;
    Store& store_;

    httplib::Server server_;
    std::thread thread_;
    std::thread refresh_thread_;
    std::atomic<bool> running_{false};

    void register_routes();
    bool check_admin(const httplib::Request& req, httplib::Response& res) const;
    void refresh_loop();
};

nlohmann::json jsonrpc_error(const nlohmann::json& id, int code, const std::string& message);

} // namespace mcpharbor
