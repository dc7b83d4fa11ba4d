#include "gateway.hpp"
#include "commands.hpp"
#include "docker_client.hpp"
#include "errors.hpp"
#include "router.hpp"
#include <iostream>
#include <csignal>
#include <chrono>

namespace mcpharbor {

static const char* kProtocolVersion = "2025-06-18";

nlohmann::json jsonrpc_error(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

static nlohmann::json jsonrpc_result(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

static void json_reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// ── HarborApp ──

HarborApp::HarborApp(ContainerManager& containers, McpManager& manager, Store& store,
                     ToolFilter& filter, std::string user_header)
    : containers_(containers), manager_(manager), store_(store), filter_(filter),
      user_header_(std::move(user_header)) {}

void HarborApp::run(LifespanContext& ctx) {
    if (!containers_.is_docker_running()) {
        std::cerr << "[gateway] Docker is not reachable; servers will fail to mount\n";
    }
    auto report = refresh([&ctx] { return ctx.cancelled(); });
    if (ctx.cancelled()) {
        manager_.router().unmount_all();
        return;
    }
    std::cerr << "[gateway] " << report.succeeded() << " servers mounted\n";
    ctx.startup_complete();

    ctx.wait_for_shutdown();
    manager_.router().unmount_all();
    std::cerr << "[gateway] All servers unmounted\n";
}

MountReport HarborApp::refresh(const std::function<bool()>& cancelled) {
    std::lock_guard<std::mutex> lock(refresh_mutex_);

    std::set<std::string> built;
    for (auto& s : store_.list_built_servers()) built.insert(s.id);

    std::set<std::string> mounted;
    for (auto& id : manager_.server_ids()) {
        if (built.count(id)) {
            mounted.insert(id);
        } else {
            manager_.remove_server(id);
        }
    }

    auto report = containers_.mount_built_servers(manager_, mounted, cancelled);
    {
        std::lock_guard<std::mutex> rlock(report_mutex_);
        last_report_ = report;
    }
    return report;
}

MountReport HarborApp::last_report() const {
    std::lock_guard<std::mutex> lock(report_mutex_);
    return last_report_;
}

std::optional<int64_t> HarborApp::identity(const httplib::Request& req) const {
    if (!req.has_header(user_header_)) return std::nullopt;
    std::string value = req.get_header_value(user_header_);
    try {
        size_t idx = 0;
        long long id = std::stoll(value, &idx);
        if (idx == value.size() && id > 0) return static_cast<int64_t>(id);
    } catch (const std::exception&) {
    }
    std::cerr << "[gateway] Ignoring malformed " << user_header_ << ": " << value << "\n";
    return std::nullopt;
}

nlohmann::json HarborApp::list_tools(std::optional<int64_t> user_id) {
    auto visible = filter_.filter(manager_.router().list_tools(), user_id);
    nlohmann::json tools = nlohmann::json::array();
    for (auto& t : visible) tools.push_back(t.to_json());
    return {{"tools", tools}};
}

nlohmann::json HarborApp::call_tool(const nlohmann::json& params, std::optional<int64_t> user_id,
                                    const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return jsonrpc_error(id, -32602, "tools/call requires a tool name");
    }
    std::string name = params["name"].get<std::string>();
    if (!filter_.is_allowed(name, user_id)) {
        std::cerr << "[gateway] Rejected call to filtered tool " << name << "\n";
        return jsonrpc_error(id, -32602, "Tool not available: " + name);
    }

    nlohmann::json args = params.contains("arguments") ? params["arguments"] : nlohmann::json::object();
    try {
        return jsonrpc_result(id, manager_.router().call_tool(name, args));
    } catch (const std::out_of_range&) {
        return jsonrpc_error(id, -32602, "Unknown tool: " + name);
    }
}

nlohmann::json HarborApp::dispatch(const nlohmann::json& msg, std::optional<int64_t> user_id) {
    if (!msg.is_object() || !msg.contains("method") || !msg["method"].is_string()) {
        return jsonrpc_error(msg.is_object() && msg.contains("id") ? msg["id"] : nlohmann::json(),
                             -32600, "Invalid request");
    }
    std::string method = msg["method"].get<std::string>();
    if (!msg.contains("id")) return nlohmann::json();   // notification
    const nlohmann::json& id = msg["id"];
    nlohmann::json params = msg.contains("params") ? msg["params"] : nlohmann::json::object();

    if (method == "initialize") {
        std::string version = kProtocolVersion;
        if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
            version = params["protocolVersion"].get<std::string>();
        }
        return jsonrpc_result(id, {
            {"protocolVersion", version},
            {"capabilities", {{"tools", {{"listChanged", false}}}}},
            {"serverInfo", {{"name", "mcpharbor"}, {"version", "1.0"}}}
        });
    }
    if (method == "ping") return jsonrpc_result(id, nlohmann::json::object());
    if (method == "tools/list") return jsonrpc_result(id, list_tools(user_id));
    if (method == "tools/call") return call_tool(params, user_id, id);

    return jsonrpc_error(id, -32601, "Method not found: " + method);
}

void HarborApp::handle(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error&) {
        json_reply(res, 400, jsonrpc_error(nullptr, -32700, "Parse error"));
        return;
    }

    auto user = identity(req);
    if (body.is_array()) {
        nlohmann::json replies = nlohmann::json::array();
        for (auto& msg : body) {
            auto r = dispatch(msg, user);
            if (!r.is_null()) replies.push_back(std::move(r));
        }
        if (replies.empty()) res.status = 202;
        else json_reply(res, 200, replies);
        return;
    }

    auto reply = dispatch(body, user);
    if (reply.is_null()) res.status = 202;
    else json_reply(res, 200, reply);
}

// ── Gateway ──

Gateway::Gateway(const Config& cfg, LifespanWrapper& lifespan, HarborApp& app,
                 ContainerManager& containers, McpManager& manager, Store& store)
    : config_(cfg), lifespan_(lifespan), app_(app), containers_(containers),
      manager_(manager), store_(store) {
    register_routes();
}

Gateway::~Gateway() {
    stop();
}

bool Gateway::check_admin(const httplib::Request& req, httplib::Response& res) const {
    if (config_.gateway.admin_token.empty()) {
        json_reply(res, 404, {{"error", "admin routes disabled"}});
        return false;
    }
    if (req.get_header_value("Authorization") != "Bearer " + config_.gateway.admin_token) {
        json_reply(res, 401, {{"error", "unauthorized"}});
        return false;
    }
    return true;
}

void Gateway::register_routes() {
    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            msg = e.what();
        } catch (...) {
            msg = "non-std exception";
        }
        std::cerr << "[http] Unhandled exception: " << msg << "\n";
        json_reply(res, 500, {{"error", msg}});
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto state = lifespan_.state();
        json_reply(res, 200, {
            {"status", state == LifespanState::running ? "ok" : to_string(state)},
            {"docker", containers_.is_docker_running()},
            {"mounted", manager_.server_count()}
        });
    });

    const std::string& path = config_.gateway.path;
    server_.Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        lifespan_.handle(req, res);
    });
    server_.Get(path, [](const httplib::Request&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "POST");
    });

    // ── Admin ──

    server_.Post("/admin/refresh", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_admin(req, res)) return;
        json_reply(res, 200, app_.refresh().to_json());
    });

    server_.Post(R"(/admin/servers/([^/]+)/restart)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_admin(req, res)) return;
        std::string id = req.matches[1];
        json_reply(res, 200, {{"server_id", id}, {"restarted", containers_.restart(id)}});
    });

    server_.Get(R"(/admin/servers/([^/]+)/logs)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_admin(req, res)) return;
        std::string id = req.matches[1];
        int tail = -1;
        if (req.has_param("tail")) {
            try {
                tail = std::stoi(req.get_param_value("tail"));
            } catch (const std::exception&) {
                json_reply(res, 400, {{"error", "tail must be a number"}});
                return;
            }
        }
        res.set_content(containers_.error_logs(id, tail), "text/plain; charset=utf-8");
    });

    server_.Delete(R"(/admin/servers/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_admin(req, res)) return;
        std::string id = req.matches[1];
        auto server = store_.get_server(id);
        if (!server) {
            json_reply(res, 404, {{"error", "server not found"}});
            return;
        }
        manager_.remove_server(id);
        containers_.cleanup_existing(ContainerManager::container_name(id));
        SecretFileManager(config_.secrets_path()).delete_server_files(id);
        bool deleted = store_.delete_server(id);
        json_reply(res, 200, {{"server_id", id}, {"deleted", deleted}});
    });

    server_.Post(R"(/admin/tools/([^/]+)/enabled)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_admin(req, res)) return;
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::parse_error&) {
            json_reply(res, 400, {{"error", "invalid JSON in request body"}});
            return;
        }
        if (!j.contains("enabled") || !j["enabled"].is_boolean()) {
            json_reply(res, 400, {{"error", "expected {\"enabled\": true|false}"}});
            return;
        }
        std::string id = req.matches[1];
        bool enabled = j["enabled"].get<bool>();
        if (!store_.set_tool_enabled(id, enabled)) {
            json_reply(res, 404, {{"error", "tool not found"}});
            return;
        }
        json_reply(res, 200, {{"tool_id", id}, {"enabled", enabled}});
    });

    server_.Put(R"(/admin/users/(\d+)/permissions/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_admin(req, res)) return;
        Permission permission;
        try {
            auto j = nlohmann::json::parse(req.body);
            permission = parse_permission(j.value("permission", ""));
        } catch (const nlohmann::json::exception&) {
            json_reply(res, 400, {{"error", "invalid JSON in request body"}});
            return;
        } catch (const std::invalid_argument& e) {
            json_reply(res, 400, {{"error", e.what()}});
            return;
        }

        int64_t user_id = 0;
        try {
            user_id = std::stoll(req.matches[1].str());
        } catch (const std::out_of_range&) {
            json_reply(res, 400, {{"error", "user id out of range"}});
            return;
        }
        std::string tool_id = req.matches[2];
        try {
            store_.set_permission(user_id, tool_id, permission);
        } catch (const IntegrityError&) {
            json_reply(res, 404, {{"error", "unknown user or tool"}});
            return;
        }
        json_reply(res, 200, {{"user_id", user_id}, {"tool_id", tool_id}, {"permission", to_string(permission)}});
    });
}

void Gateway::refresh_loop() {
    int interval = config_.mount.refresh_interval;
    while (running_) {
        for (int i = 0; i < interval * 10 && running_; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!running_ || lifespan_.state() != LifespanState::running) continue;
        try {
            auto report = app_.refresh();
            if (!report.outcomes.empty()) {
                std::cerr << "[gateway] Refresh mounted " << report.succeeded() << " new servers\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[gateway] Refresh failed: " << e.what() << "\n";
        }
    }
}

void Gateway::start() {
    if (running_.exchange(true)) return;
    const std::string host = config_.gateway.host;
    const int port = config_.gateway.port;
    thread_ = std::thread([this, host, port]() {
        std::cerr << "[http] Listening on " << host << ":" << port << "\n";
        if (!server_.listen(host, port)) {
            std::cerr << "[http] Failed to listen on " << host << ":" << port << "\n";
        }
    });
    if (config_.mount.refresh_interval > 0) {
        refresh_thread_ = std::thread(&Gateway::refresh_loop, this);
    }
}

void Gateway::stop() {
    running_ = false;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    if (refresh_thread_.joinable()) refresh_thread_.join();
}

// ── serve command ──

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

int cmd_serve(const std::string& config_path, const std::string& host, int port) {
    Config cfg = Config::load(config_path);
    if (!host.empty()) cfg.gateway.host = host;
    if (port > 0) cfg.gateway.port = port;

    fs::create_directories(cfg.data_path());
    Store store(cfg.database_path());
    DockerClient docker(cfg.docker.host, cfg.docker.timeout);
    ContainerManager containers(docker, store, cfg);
    McpRouter router;
    McpManager manager(router, store);
    ToolFilter filter(store);

    auto app = std::make_shared<HarborApp>(containers, manager, store, filter, cfg.gateway.user_header);
    LifespanWrapper lifespan(app, cfg.lifespan);

    try {
        lifespan.ensure_started();
    } catch (const StartupError& e) {
        std::cerr << "[gateway] " << e.what() << "\n";
        return 1;
    }

    Gateway gateway(cfg, lifespan, *app, containers, manager, store);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    gateway.start();
    std::cerr << "[gateway] Ready at http://" << cfg.gateway.host << ":" << cfg.gateway.port
              << cfg.gateway.path << "\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[gateway] Shutting down...\n";
    gateway.stop();
    lifespan.shutdown();
    std::cerr << "[gateway] Done.\n";
    return 0;
}

} // namespace mcpharbor
