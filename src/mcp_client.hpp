#pragma once
#include "mcp_config.hpp"
#include "tool_filter.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>

namespace mcpharbor {

// Stdio MCP session with one launched process (docker exec / docker run).
// Requests are serialized; one client may be shared across threads.
class McpClient {
public:
    McpClient(const std::string& name, LaunchConfig cfg, int timeout_seconds = 60);
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    bool connect();
    void disconnect();

    // Empty when the server does not answer tools/list
    std::vector<ToolDescriptor> list_tools();
    // MCP tools/call result object. Throws std::runtime_error when the
    // process does not answer or returns a JSON-RPC error.
    nlohmann::json call_tool(const std::string& tool_name, const nlohmann::json& args);

    const std::string& name() const { return name_; }
    bool connected() const { return connected_; }

private:
    std::string name_;
    LaunchConfig config_;
    int timeout_ms_;
    std::atomic<bool> connected_{false};
    int next_id_ = 1;
    std::mutex io_mutex_;
    std::string buffer_;

    pid_t child_pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;

    bool spawn();
    bool handshake();
    void reap_child();
    nlohmann::json send_request(const std::string& method, const nlohmann::json& params);
    void send_notification(const std::string& method, const nlohmann::json& params = {});
    bool read_line(std::string& line, int timeout_ms);
    bool write_line(const std::string& json_str);
};

} // namespace mcpharbor
