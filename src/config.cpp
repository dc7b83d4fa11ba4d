#include "config.hpp"
#include <fstream>
#include <iostream>

namespace mcpharbor {

Config Config::make_default() {
    Config c;
    c.apply_env_overrides();
    return c;
}

void Config::apply_env_overrides() {
    if (const char* h = std::getenv("DOCKER_HOST"); h && *h) {
        docker.host = h;
    }
    if (const char* t = std::getenv("DOCKER_TIMEOUT"); t && *t) {
        try {
            docker.timeout = std::stoi(t);
        } catch (const std::exception&) {
            std::cerr << "[config] Warning: ignoring invalid DOCKER_TIMEOUT '" << t << "'\n";
        }
    }
    if (const char* d = std::getenv("MCPHARBOR_DATA_DIR"); d && *d) {
        data_dir = d;
    }
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    j["data_dir"] = data_dir;
    if (!database.empty()) j["database"] = database;
    if (!secrets_dir.empty()) j["secrets_dir"] = secrets_dir;

    auto& d = j["docker"];
    d["host"] = docker.host;
    d["timeout"] = docker.timeout;
    d["log_tail"] = docker.log_tail;
    d["image_namespace"] = docker.image_namespace;
    d["memory_limit"] = docker.memory_limit;
    if (!docker.network.empty()) d["network"] = docker.network;

    j["mount"] = {
        {"concurrency", mount.concurrency},
        {"refresh_interval", mount.refresh_interval}
    };

    auto& g = j["gateway"];
    g["host"] = gateway.host;
    g["port"] = gateway.port;
    g["path"] = gateway.path;
    g["user_header"] = gateway.user_header;
    if (!gateway.admin_token.empty()) g["admin_token"] = gateway.admin_token;

    j["lifespan"] = {
        {"startup_timeout", lifespan.startup_timeout},
        {"shutdown_timeout", lifespan.shutdown_timeout}
    };

    if (!default_env.empty()) j["default_env"] = default_env;

    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    c.data_dir = j.value("data_dir", c.data_dir);
    c.database = j.value("database", c.database);
    c.secrets_dir = j.value("secrets_dir", c.secrets_dir);

    if (j.contains("docker") && j["docker"].is_object()) {
        auto& d = j["docker"];
        c.docker.host = d.value("host", c.docker.host);
        c.docker.timeout = d.value("timeout", c.docker.timeout);
        c.docker.log_tail = d.value("log_tail", c.docker.log_tail);
        c.docker.image_namespace = d.value("image_namespace", c.docker.image_namespace);
        c.docker.memory_limit = d.value("memory_limit", c.docker.memory_limit);
        c.docker.network = d.value("network", c.docker.network);
    }

    if (j.contains("mount") && j["mount"].is_object()) {
        auto& m = j["mount"];
        c.mount.concurrency = m.value("concurrency", c.mount.concurrency);
        c.mount.refresh_interval = m.value("refresh_interval", c.mount.refresh_interval);
    }
    if (c.mount.concurrency < 1) c.mount.concurrency = 1;

    if (j.contains("gateway") && j["gateway"].is_object()) {
        auto& g = j["gateway"];
        c.gateway.host = g.value("host", c.gateway.host);
        c.gateway.port = g.value("port", c.gateway.port);
        c.gateway.path = g.value("path", c.gateway.path);
        c.gateway.user_header = g.value("user_header", c.gateway.user_header);
        c.gateway.admin_token = g.value("admin_token", c.gateway.admin_token);
    }

    if (j.contains("lifespan") && j["lifespan"].is_object()) {
        auto& l = j["lifespan"];
        c.lifespan.startup_timeout = l.value("startup_timeout", c.lifespan.startup_timeout);
        c.lifespan.shutdown_timeout = l.value("shutdown_timeout", c.lifespan.shutdown_timeout);
    }

    if (j.contains("default_env") && j["default_env"].is_object()) {
        for (auto& [k, v] : j["default_env"].items()) {
            if (v.is_string()) c.default_env[k] = v.get<std::string>();
        }
    }

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    Config c;
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        c = from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
    c.apply_env_overrides();
    return c;
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace mcpharbor
