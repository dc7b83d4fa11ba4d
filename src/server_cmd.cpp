#include "commands.hpp"
#include "config.hpp"
#include "container_manager.hpp"
#include "docker_client.hpp"
#include "mcp_manager.hpp"
#include "router.hpp"
#include "store.hpp"
#include <iostream>

namespace mcpharbor {

int cmd_mount(const std::string& config_path) {
    Config cfg = Config::load(config_path);
    fs::create_directories(cfg.data_path());
    Store store(cfg.database_path());
    DockerClient docker(cfg.docker.host, cfg.docker.timeout);
    ContainerManager containers(docker, store, cfg);
    McpRouter router;
    McpManager manager(router, store);

    if (!containers.is_docker_running()) {
        std::cerr << "Docker is not reachable at " << cfg.docker.host << "\n";
        return 1;
    }

    auto report = containers.mount_built_servers(manager);
    for (auto& o : report.outcomes) {
        std::cout << (o.ok ? "[OK]   " : "[FAIL] ") << o.server_name << " (" << o.server_id << ")";
        if (o.ok) {
            std::cout << (o.reused ? " reused" : " started") << ", " << o.tool_count << " tools";
        } else {
            std::cout << ": " << o.error;
        }
        std::cout << "\n";
    }
    std::cout << report.succeeded() << " mounted, " << report.failed() << " failed\n";
    router.unmount_all();
    return report.failed() == 0 ? 0 : 1;
}

int cmd_build(const std::string& config_path, const std::string& server_id) {
    Config cfg = Config::load(config_path);
    fs::create_directories(cfg.data_path());
    Store store(cfg.database_path());
    auto server = store.get_server(server_id);
    if (!server) {
        std::cerr << "Server not found: " << server_id << "\n";
        return 1;
    }

    DockerClient docker(cfg.docker.host, cfg.docker.timeout);
    ContainerManager containers(docker, store, cfg);
    if (!containers.is_docker_running()) {
        std::cerr << "Docker is not reachable at " << cfg.docker.host << "\n";
        return 1;
    }

    bool ok = containers.build_server_image(*server);
    std::cout << (ok ? "Built " : "Build failed for ") << server->name
              << " (" << containers.image_tag(*server) << ")\n";
    return ok ? 0 : 1;
}

int cmd_logs(const std::string& config_path, const std::string& server_id, int tail) {
    Config cfg = Config::load(config_path);
    Store store(cfg.database_path());
    DockerClient docker(cfg.docker.host, cfg.docker.timeout);
    ContainerManager containers(docker, store, cfg);

    std::string logs = containers.error_logs(server_id, tail);
    if (logs.empty()) {
        std::cerr << "No logs for " << ContainerManager::container_name(server_id) << "\n";
        return 1;
    }
    std::cout << logs;
    if (logs.back() != '\n') std::cout << "\n";
    return 0;
}

int cmd_restart(const std::string& config_path, const std::string& server_id) {
    Config cfg = Config::load(config_path);
    Store store(cfg.database_path());
    DockerClient docker(cfg.docker.host, cfg.docker.timeout);
    ContainerManager containers(docker, store, cfg);

    if (!containers.restart(server_id)) {
        std::cerr << "Restart failed for " << ContainerManager::container_name(server_id)
                  << "; run 'mcpharbor mount' to recreate it\n";
        return 1;
    }
    std::cout << "Restarted " << ContainerManager::container_name(server_id) << "\n";
    return 0;
}

} // namespace mcpharbor
