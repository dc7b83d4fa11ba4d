#include "mcp_client.hpp"
#include <iostream>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>

namespace mcpharbor {

// Empty unless the field holds a string
static std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

McpClient::McpClient(const std::string& name, LaunchConfig cfg, int timeout_seconds)
    : name_(name), config_(std::move(cfg)), timeout_ms_(timeout_seconds * 1000) {}

McpClient::~McpClient() {
    disconnect();
}

// ── Process ──

bool McpClient::spawn() {
    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    auto close_fds = [&]() {
        for (int fd : {to_child[0], to_child[1], from_child[0], from_child[1]}) {
            if (fd >= 0) close(fd);
        }
    };

    // Close-on-exec keeps sibling servers spawned concurrently from holding
    // each other's pipes; dup2 clears the flag on the stdio copies
    if (pipe2(to_child, O_CLOEXEC) != 0 || pipe2(from_child, O_CLOEXEC) != 0) {
        std::cerr << "[mcp:" << name_ << "] pipe: " << std::strerror(errno) << "\n";
        close_fds();
        return false;
    }

    // argv and envp are prepared before fork; the child only calls
    // async-signal-safe functions
    std::vector<const char*> argv;
    argv.reserve(config_.args.size() + 2);
    argv.push_back(config_.command.c_str());
    for (auto& a : config_.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_entries;
    for (char** e = environ; e && *e; e++) {
        std::string entry(*e);
        if (!config_.env.count(entry.substr(0, entry.find('=')))) env_entries.push_back(std::move(entry));
    }
    for (auto& [k, v] : config_.env) env_entries.push_back(k + "=" + v);
    std::vector<const char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& e : env_entries) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[mcp:" << name_ << "] fork: " << std::strerror(errno) << "\n";
        close_fds();
        return false;
    }

    if (pid == 0) {
        // stderr is inherited so container diagnostics reach our log, not the protocol stream
        dup2(to_child[0], STDIN_FILENO);
        dup2(from_child[1], STDOUT_FILENO);
        close_fds();
        execvpe(argv[0], const_cast<char* const*>(argv.data()), const_cast<char* const*>(envp.data()));
        _exit(127);
    }

    close(to_child[0]);
    close(from_child[1]);
    child_pid_ = pid;
    stdin_fd_ = to_child[1];
    stdout_fd_ = from_child[0];
    return true;
}

void McpClient::reap_child() {
    if (child_pid_ <= 0) return;
    kill(child_pid_, SIGTERM);

    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (waitpid(child_pid_, &status, WNOHANG) == 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "[mcp:" << name_ << "] Process ignored SIGTERM, killing\n";
            kill(child_pid_, SIGKILL);
            waitpid(child_pid_, &status, 0);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    child_pid_ = -1;
}

bool McpClient::handshake() {
    auto result = send_request("initialize", {
        {"protocolVersion", "2025-06-18"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "mcpharbor"}, {"version", "1.0"}}}
    });
    if (result.is_null() || result.contains("error")) return false;
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        std::cerr << "[mcp:" << name_ << "] Server "
                  << string_field(result["serverInfo"], "name") << " "
                  << string_field(result["serverInfo"], "version") << "\n";
    }
    send_notification("notifications/initialized");
    return true;
}

bool McpClient::connect() {
    if (config_.command.empty()) {
        std::cerr << "[mcp:" << name_ << "] Launch config has no command\n";
        return false;
    }
    // A dead child must surface as EPIPE on write, not terminate the gateway
    signal(SIGPIPE, SIG_IGN);

    if (!spawn()) return false;
    if (!handshake()) {
        std::cerr << "[mcp:" << name_ << "] MCP handshake failed\n";
        disconnect();
        return false;
    }
    connected_ = true;
    std::cerr << "[mcp:" << name_ << "] Connected (" << config_.key << ")\n";
    return true;
}

void McpClient::disconnect() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    connected_ = false;
    for (int* fd : {&stdin_fd_, &stdout_fd_}) {
        if (*fd >= 0) {
            close(*fd);
            *fd = -1;
        }
    }
    reap_child();
    buffer_.clear();
}

bool McpClient::read_line(std::string& line, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;

        struct pollfd pfd;
        pfd.fd = stdout_fd_;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(left));
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char chunk[4096];
        ssize_t n = read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;   // EOF: process exited
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

bool McpClient::write_line(const std::string& json_str) {
    std::string line = json_str + "\n";
    size_t total = 0;
    while (total < line.size()) {
        ssize_t n = write(stdin_fd_, line.c_str() + total, line.size() - total);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

// ── JSON-RPC ──

nlohmann::json McpClient::send_request(const std::string& method, const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (stdin_fd_ < 0) return nlohmann::json();

    int id = next_id_++;
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null() && !params.empty()) {
        req["params"] = params;
    }

    if (!write_line(req.dump())) {
        std::cerr << "[mcp:" << name_ << "] Write failed for " << method << "\n";
        return nlohmann::json();
    }

    // Skip notifications and stray output until the matching response
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    std::string line;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0 || !read_line(line, static_cast<int>(left))) {
            std::cerr << "[mcp:" << name_ << "] No response to " << method << "\n";
            return nlohmann::json();
        }
        if (line.empty()) continue;

        nlohmann::json resp;
        try {
            resp = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error&) {
            continue;
        }
        if (!resp.is_object() || !resp.contains("id") || !resp["id"].is_number_integer()) continue;
        if (resp["id"].get<int>() != id) continue;
        if (resp.contains("result")) return resp["result"];
        return resp;
    }
}

void McpClient::send_notification(const std::string& method, const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (stdin_fd_ < 0) return;
    nlohmann::json notif = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null() && !params.empty()) {
        notif["params"] = params;
    }
    if (!write_line(notif.dump())) {
        std::cerr << "[mcp:" << name_ << "] Write failed for " << method << "\n";
    }
}

std::vector<ToolDescriptor> McpClient::list_tools() {
    std::vector<ToolDescriptor> tools;

    auto result = send_request("tools/list", nlohmann::json::object());
    if (result.is_null() || !result.contains("tools") || !result["tools"].is_array()) return tools;

    // A malformed entry is skipped; it never fails the whole listing
    for (auto& t : result["tools"]) {
        if (!t.is_object()) continue;
        try {
            ToolDescriptor td;
            td.name = string_field(t, "name");
            td.description = string_field(t, "description");
            auto schema = t.find("inputSchema");
            if (schema != t.end() && schema->is_object()) {
                td.input_schema = *schema;
            } else {
                td.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
            }
            if (!td.name.empty()) tools.push_back(std::move(td));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[mcp:" << name_ << "] Skipping malformed tool entry: " << e.what() << "\n";
        }
    }
    return tools;
}

nlohmann::json McpClient::call_tool(const std::string& tool_name, const nlohmann::json& args) {
    auto result = send_request("tools/call", {
        {"name", tool_name},
        {"arguments", args.is_null() ? nlohmann::json::object() : args}
    });

    if (result.is_null()) {
        throw std::runtime_error("MCP server " + name_ + " did not answer tools/call");
    }
    if (result.contains("error") && result["error"].is_object()) {
        auto& err = result["error"];
        std::string message = string_field(err, "message");
        throw std::runtime_error("MCP server " + name_ + ": " + (message.empty() ? err.dump() : message));
    }
    return result;
}

} // namespace mcpharbor
