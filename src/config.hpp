#pragma once
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace mcpharbor {

struct DockerConfig {
    std::string host = "unix:///var/run/docker.sock";
    int timeout = 120;                       // seconds, per runtime call
    int log_tail = 50;                       // default lines for error_logs
    std::string image_namespace = "mcp-harbor";
    std::string memory_limit = "1g";         // passed to `docker run --memory`
    std::string network;                     // empty = daemon default
};

struct MountConfig {
    int concurrency = 4;         // servers reconciled in parallel
    int refresh_interval = 0;    // seconds between background refreshes, 0 = off
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
    std::string path = "/mcp";
    std::string user_header = "X-MCP-User-Id";  // set by the upstream auth proxy
    std::string admin_token;                     // empty = admin routes disabled
};

struct LifespanConfig {
    int startup_timeout = 30;    // seconds
    int shutdown_timeout = 10;   // seconds
};

struct Config {
    std::string data_dir = "~/.mcpharbor/data";
    std::string database;        // empty = <data_dir>/mcpharbor.db
    std::string secrets_dir;     // empty = <data_dir>/secrets

    DockerConfig docker;
    MountConfig mount;
    GatewayConfig gateway;
    LifespanConfig lifespan;

    // Env bindings added to every managed container
    std::map<std::string, std::string> default_env;

    // Derived helpers
    std::string data_path() const { return expand_path(data_dir); }
    std::string database_path() const {
        return database.empty() ? data_path() + "/mcpharbor.db" : expand_path(database);
    }
    std::string secrets_path() const {
        return secrets_dir.empty() ? data_path() + "/secrets" : expand_path(secrets_dir);
    }

    // DOCKER_HOST, DOCKER_TIMEOUT, MCPHARBOR_DATA_DIR
    void apply_env_overrides();

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace mcpharbor
