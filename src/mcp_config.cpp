#include "mcp_config.hpp"
#include "container_manager.hpp"
#include <iostream>

namespace mcpharbor {

nlohmann::json LaunchConfig::to_json() const {
    return {{key, {{"command", command}, {"args", args}, {"env", env}}}};
}

LaunchConfig build_config(ContainerManager& containers, const Server& server) {
    return build_config(containers, server, containers.health(server));
}

LaunchConfig build_config(ContainerManager& containers, const Server& server, HealthVerdict verdict) {
    std::string name = ContainerManager::container_name(server.id);
    auto start = containers.parse_start_command(server);

    LaunchConfig cfg;
    cfg.env = containers.env_vars(server);
    auto mounts = containers.secrets().mounts_for(server);
    for (auto& m : mounts) cfg.env[m.env_var_name] = m.container_path;

    if (verdict == HealthVerdict::healthy) {
        cfg.key = "existing";
        cfg.args = {"exec", "-i"};
        for (auto& [k, v] : cfg.env) {
            cfg.args.push_back("-e");
            cfg.args.push_back(k);
        }
        cfg.args.push_back(name);
        cfg.args.insert(cfg.args.end(), start.begin(), start.end());
        std::cerr << "[config] " << server.name << ": attaching to running container " << name << "\n";
        return cfg;
    }

    auto& docker = containers.config().docker;
    cfg.key = "new";
    cfg.args = {"run", "-i", "--name", name, "--label", "mcpharbor.server=" + server.id};
    if (!docker.memory_limit.empty()) {
        cfg.args.push_back("--memory");
        cfg.args.push_back(docker.memory_limit);
    }
    if (!docker.network.empty()) {
        cfg.args.push_back("--network");
        cfg.args.push_back(docker.network);
    }
    for (auto& [k, v] : cfg.env) {
        cfg.args.push_back("-e");
        cfg.args.push_back(k);
    }
    for (auto& m : mounts) {
        cfg.args.push_back("-v");
        cfg.args.push_back(m.volume_arg());
    }
    cfg.args.push_back(containers.image_tag(server));
    cfg.args.insert(cfg.args.end(), start.begin(), start.end());
    std::cerr << "[config] " << server.name << ": starting new container " << name << "\n";
    return cfg;
}

} // namespace mcpharbor
