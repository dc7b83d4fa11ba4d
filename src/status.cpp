#include "commands.hpp"
#include "config.hpp"
#include "container_manager.hpp"
#include "docker_client.hpp"
#include "errors.hpp"
#include "store.hpp"
#include <iostream>

namespace mcpharbor {

int cmd_status(const std::string& config_path) {
    Config cfg = Config::load(config_path);

    std::cout << "=== mcpharbor status ===\n";
    std::cout << "Config path  : " << config_path << "\n";
    std::cout << "Data dir     : " << cfg.data_path() << "\n";
    std::cout << "Database     : " << cfg.database_path() << "\n";
    std::cout << "Secrets      : " << cfg.secrets_path() << "\n";
    std::cout << "Docker host  : " << cfg.docker.host << " (timeout " << cfg.docker.timeout << "s)\n";
    std::cout << "Image prefix : " << cfg.docker.image_namespace << "\n";
    std::cout << "Gateway      : http://" << cfg.gateway.host << ":" << cfg.gateway.port
              << cfg.gateway.path << "\n";
    if (!cfg.gateway.admin_token.empty()) {
        std::cout << "Admin API    : Bearer token enabled\n";
    }
    if (cfg.mount.refresh_interval > 0) {
        std::cout << "Refresh      : every " << cfg.mount.refresh_interval << "s\n";
    }

    DockerClient docker(cfg.docker.host, cfg.docker.timeout);
    bool docker_up = docker.ping();
    std::cout << "Docker       : " << (docker_up ? "reachable" : "NOT reachable") << "\n";

    if (!fs::exists(cfg.database_path())) {
        std::cout << "Servers      : (no database yet)\n";
        return 0;
    }

    try {
        Store store(cfg.database_path());
        ContainerManager containers(docker, store, cfg);
        auto servers = store.list_servers();
        auto tools = store.tools_by_server();
        std::cout << "Servers      : " << servers.size() << "\n";
        for (auto& s : servers) {
            std::cout << "  " << s.id << "  " << s.name
                      << "  [" << to_string(s.runtime_type) << ", " << to_string(s.build_status) << "]";
            if (!s.active) std::cout << " (inactive)";
            if (docker_up && s.build_status == BuildStatus::built) {
                std::cout << "  container " << to_string(containers.health(s));
            }
            auto it = tools.find(s.name);
            std::cout << "  tools " << (it == tools.end() ? 0 : it->second.size()) << "\n";
            if (s.build_error) std::cout << "      error: " << *s.build_error << "\n";
        }
    } catch (const StoreError& e) {
        std::cout << "Servers      : (error reading: " << e.what() << ")\n";
        return 1;
    }
    return 0;
}

} // namespace mcpharbor
