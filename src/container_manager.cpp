#include "container_manager.hpp"
#include "errors.hpp"
#include "mcp_config.hpp"
#include "mcp_manager.hpp"
#include "shell_words.hpp"
#include "store.hpp"
#include "utils.hpp"
#include <algorithm>
#include <initializer_list>
#include <atomic>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace mcpharbor {

namespace {

bool is_flag(const std::string& w, std::initializer_list<const char*> names) {
    for (auto n : names) if (w == n) return true;
    return false;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

std::string to_string(HealthVerdict v) {
    switch (v) {
        case HealthVerdict::absent: return "absent";
        case HealthVerdict::unhealthy: return "unhealthy";
        case HealthVerdict::healthy: return "healthy";
    }
    return "unknown";
}

// ── MountReport ──

size_t MountReport::succeeded() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [](const MountOutcome& o) { return o.ok; }));
}

size_t MountReport::failed() const {
    return outcomes.size() - succeeded();
}

nlohmann::json MountReport::to_json() const {
    nlohmann::json servers = nlohmann::json::array();
    for (auto& o : outcomes) {
        nlohmann::json s = {
            {"server_id", o.server_id},
            {"name", o.server_name},
            {"ok", o.ok},
            {"reused", o.reused},
            {"tools", o.tool_count}
        };
        if (!o.error.empty()) s["error"] = o.error;
        servers.push_back(std::move(s));
    }
    return {{"succeeded", succeeded()}, {"failed", failed()}, {"servers", servers}};
}

// ── ContainerManager ──

ContainerManager::ContainerManager(ContainerRuntime& runtime, Store& store, const Config& config)
    : runtime_(runtime), store_(store), config_(config), secrets_(config.secrets_path()) {}

bool ContainerManager::is_docker_running() {
    try {
        return runtime_.ping();
    } catch (const std::exception& e) {
        std::cerr << "[docker] Daemon not reachable: " << e.what() << "\n";
        return false;
    }
}

std::string ContainerManager::image_tag(const Server& server) const {
    return config_.docker.image_namespace + "/server-" + server.id;
}

std::string ContainerManager::container_name(const std::string& server_id) {
    return "mcp-" + server_id;
}

HealthVerdict ContainerManager::health(const Server& server) {
    std::string name = container_name(server.id);
    ContainerInfo info;
    try {
        info = runtime_.get_container(name);
    } catch (const DockerNotFound&) {
        return HealthVerdict::absent;
    } catch (const std::exception& e) {
        std::cerr << "[containers] Health check failed for " << name << ": " << e.what() << "\n";
        return HealthVerdict::unhealthy;
    }

    if (!info.running()) {
        std::cerr << "[containers] " << name << " is " << info.status << "\n";
        return HealthVerdict::unhealthy;
    }
    std::string tag = image_tag(server);
    if (!info.has_image_tag(tag)) {
        std::cerr << "[containers] " << name << " runs a stale image (expected " << tag << ")\n";
        return HealthVerdict::unhealthy;
    }
    return HealthVerdict::healthy;
}

void ContainerManager::cleanup_stopped(const std::string& name) {
    try {
        auto info = runtime_.get_container(name);
        if (info.running()) return;
        runtime_.remove(info.id, true);
        std::cerr << "[containers] Removed stopped container " << name << "\n";
    } catch (const DockerNotFound&) {
    } catch (const DockerError& e) {
        std::cerr << "[containers] Failed to remove stopped container " << name << ": " << e.what() << "\n";
    }
}

void ContainerManager::cleanup_existing(const std::string& name) {
    ContainerInfo info;
    try {
        info = runtime_.get_container(name);
    } catch (const DockerNotFound&) {
        return;
    } catch (const DockerError& e) {
        std::cerr << "[containers] Cannot inspect " << name << " for cleanup: " << e.what() << "\n";
        return;
    }

    try {
        runtime_.stop(info.id, 10);
    } catch (const DockerError& e) {
        std::cerr << "[containers] Stop failed for " << name << ", forcing removal: " << e.what() << "\n";
    }
    try {
        runtime_.remove(info.id, true);
        std::cerr << "[containers] Removed container " << name << "\n";
    } catch (const DockerNotFound&) {
    } catch (const DockerError& e) {
        std::cerr << "[containers] Failed to remove " << name << ": " << e.what() << "\n";
    }
}

bool ContainerManager::restart(const std::string& server_id) {
    std::string name = container_name(server_id);
    try {
        auto info = runtime_.get_container(name);
        runtime_.restart(info.id);
        std::cerr << "[containers] Restarted " << name << "\n";
        return true;
    } catch (const DockerNotFound&) {
        std::cerr << "[containers] Cannot restart " << name << ": not found\n";
    } catch (const DockerError& e) {
        std::cerr << "[containers] Failed to restart " << name << ": " << e.what() << "\n";
    }
    return false;
}

std::string ContainerManager::error_logs(const std::string& server_id, int tail) {
    if (tail < 0) tail = config_.docker.log_tail;
    std::string name = container_name(server_id);
    try {
        auto info = runtime_.get_container(name);
        return sanitize_utf8(runtime_.logs(info.id, tail));
    } catch (const DockerNotFound&) {
    } catch (const DockerError& e) {
        std::cerr << "[containers] Failed to read logs of " << name << ": " << e.what() << "\n";
    }
    return "";
}

void ContainerManager::ensure_image_exists(const std::string& ref) {
    try {
        runtime_.get_image(ref);
        return;
    } catch (const ImageNotFound&) {
        std::cerr << "[containers] Image " << ref << " not present locally\n";
    }
    runtime_.pull_image(ref);
}

// ── Commands ──

std::string ContainerManager::parse_install_command(const Server& server) const {
    auto words = split_shell_words(server.install_command);
    if (words.empty()) return "";

    switch (server.runtime_type) {
    case RuntimeType::npx: {
        if (words[0] == "npx") {
            std::vector<std::string> out = {"npm", "install", "-g"};
            for (size_t i = 1; i < words.size(); i++) {
                if (!is_flag(words[i], {"-y", "--yes"})) out.push_back(words[i]);
            }
            return join_shell_words(out);
        }
        if (words[0] == "npm" && words.size() > 1 && is_flag(words[1], {"install", "i"})) {
            bool global = std::any_of(words.begin(), words.end(), [](const std::string& w) {
                return w == "-g" || w == "--global";
            });
            if (!global) words.insert(words.begin() + 2, "-g");
        }
        return join_shell_words(words);
    }

    case RuntimeType::uvx: {
        if (words[0] == "pip" || words[0] == "pip3") {
            // The uv base image has no pip; install into the system interpreter
            std::vector<std::string> out = {"uv", "pip"};
            out.insert(out.end(), words.begin() + 1, words.end());
            words = std::move(out);
        } else if (words[0] == "uvx") {
            std::vector<std::string> out = {"uv", "tool", "install"};
            for (size_t i = 1; i < words.size(); i++) out.push_back(words[i]);
            return join_shell_words(out);
        }
        if (words.size() > 2 && words[0] == "uv" && words[1] == "pip" && words[2] == "install" &&
            std::find(words.begin(), words.end(), "--system") == words.end()) {
            words.insert(words.begin() + 3, "--system");
        }
        return join_shell_words(words);
    }

    case RuntimeType::docker:
        // install_command names the image; nothing runs inside it
        return "";
    }
    return join_shell_words(words);
}

std::vector<std::string> ContainerManager::parse_start_command(const Server& server) const {
    auto words = split_shell_words(server.start_command);
    if (words.empty()) return words;

    if (server.runtime_type == RuntimeType::npx && words[0] == "npx") {
        // Never block on the install prompt, stdin belongs to the protocol
        bool yes = words.size() > 1 && is_flag(words[1], {"-y", "--yes"});
        if (!yes) words.insert(words.begin() + 1, "-y");
    }
    return words;
}

std::map<std::string, std::string> ContainerManager::env_vars(const Server& server) const {
    std::map<std::string, std::string> env = config_.default_env;
    for (auto& v : server.env_variables) {
        if (v.key.empty()) continue;
        if (v.value.empty()) {
            if (v.required) {
                std::cerr << "[containers] " << server.name << ": required variable " << v.key
                          << " has no value\n";
            }
            continue;
        }
        env[v.key] = v.value;
    }
    return env;
}

// ── Build ──

std::string base_image_for(const Server& server) {
    switch (server.runtime_type) {
        case RuntimeType::npx: return "node:20-slim";
        case RuntimeType::uvx: return "ghcr.io/astral-sh/uv:python3.12-bookworm-slim";
        case RuntimeType::docker: {
            std::string ref = trim(server.install_command);
            if (ref.empty()) {
                throw std::invalid_argument("docker server " + server.id + " has no image reference");
            }
            return ref;
        }
    }
    throw std::invalid_argument("unknown runtime for server " + server.id);
}

std::string ContainerManager::dockerfile_for(const Server& server) const {
    std::string df = "FROM " + base_image_for(server) + "\n";
    if (server.runtime_type != RuntimeType::docker) df += "WORKDIR /app\n";

    std::string install = parse_install_command(server);
    if (!install.empty()) df += "RUN " + install + "\n";

    auto start = parse_start_command(server);
    if (!start.empty()) df += "CMD " + nlohmann::json(start).dump() + "\n";
    return df;
}

bool ContainerManager::build_server_image(const Server& server) {
    std::string tag = image_tag(server);
    store_.update_build_status(server.id, BuildStatus::building);
    std::cerr << "[build] " << server.name << " -> " << tag << "\n";

    try {
        std::string dockerfile = dockerfile_for(server);
        ensure_image_exists(base_image_for(server));
        std::string output = runtime_.build_image(tag, dockerfile);
        if (!output.empty()) std::cerr << output;
    } catch (const std::exception& e) {
        std::cerr << "[build] " << server.name << " failed: " << e.what() << "\n";
        store_.update_build_status(server.id, BuildStatus::failed, std::string(e.what()));
        return false;
    }

    store_.set_image_tag(server.id, tag);
    store_.update_build_status(server.id, BuildStatus::built);
    std::cerr << "[build] " << server.name << " built\n";
    return true;
}

// ── Reconciliation ──

bool ContainerManager::is_reused(const std::string& name) const {
    std::lock_guard<std::mutex> lock(reused_mutex_);
    return reused_.count(name) > 0;
}

std::set<std::string> ContainerManager::reused_containers() const {
    std::lock_guard<std::mutex> lock(reused_mutex_);
    return reused_;
}

void ContainerManager::mark_reused(const std::string& name) {
    std::lock_guard<std::mutex> lock(reused_mutex_);
    reused_.insert(name);
}

void ContainerManager::forget_reused(const std::string& name) {
    std::lock_guard<std::mutex> lock(reused_mutex_);
    reused_.erase(name);
}

MountOutcome ContainerManager::mount_one(const Server& server, McpManager& manager) {
    MountOutcome o;
    o.server_id = server.id;
    o.server_name = server.name;

    std::string name = container_name(server.id);
    try {
        // One verdict per pass drives both cleanup and the launch branch
        HealthVerdict verdict = health(server);
        if (verdict == HealthVerdict::healthy) {
            mark_reused(name);
            o.reused = true;
            std::cerr << "[mount] Reusing container " << name << "\n";
        } else {
            forget_reused(name);
            cleanup_existing(name);
            ensure_image_exists(image_tag(server));
        }

        LaunchConfig launch = build_config(*this, server, verdict);
        auto tools = manager.add_server(server, launch);
        o.tool_count = tools.size();
        o.ok = true;
    } catch (const std::exception& e) {
        o.error = e.what();
        std::cerr << "[mount] " << server.name << " failed: " << e.what() << "\n";
    }
    return o;
}

MountReport ContainerManager::mount_built_servers(McpManager& manager, const std::set<std::string>& skip,
                                                  const std::function<bool()>& cancelled) {
    std::vector<Server> servers;
    for (auto& s : store_.list_built_servers()) {
        if (!skip.count(s.id)) servers.push_back(std::move(s));
    }
    MountReport report;
    report.outcomes.resize(servers.size());
    if (servers.empty()) {
        std::cerr << "[mount] No built servers to mount\n";
        return report;
    }

    size_t workers = static_cast<size_t>(std::max(1, config_.mount.concurrency));
    workers = std::min(workers, servers.size());

    std::atomic<size_t> next{0};
    auto work = [&]() {
        for (size_t i = next++; i < servers.size(); i = next++) {
            if (cancelled && cancelled()) {
                auto& o = report.outcomes[i];
                o.server_id = servers[i].id;
                o.server_name = servers[i].name;
                o.error = "mount pass cancelled";
                continue;
            }
            report.outcomes[i] = mount_one(servers[i], manager);
        }
    };

    std::vector<std::thread> pool;
    for (size_t w = 1; w < workers; w++) pool.emplace_back(work);
    work();
    for (auto& t : pool) t.join();

    if (cancelled && cancelled()) std::cerr << "[mount] Pass cancelled\n";
    std::cerr << "[mount] Mounted " << report.succeeded() << "/" << servers.size() << " servers";
    if (report.failed() > 0) std::cerr << " (" << report.failed() << " failed)";
    std::cerr << "\n";
    return report;
}

} // namespace mcpharbor
