#pragma once
#include "config.hpp"
#include "docker_client.hpp"
#include "models.hpp"
#include "secret_files.hpp"
#include <functional>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>

namespace mcpharbor {

class Store;
class McpManager;

enum class HealthVerdict {
    absent,
    unhealthy,   // stopped, or running an image other than the server's tag
    healthy,
};

std::string to_string(HealthVerdict v);

struct MountOutcome {
    std::string server_id;
    std::string server_name;
    bool ok = false;
    bool reused = false;
    size_t tool_count = 0;
    std::string error;
};

struct MountReport {
    std::vector<MountOutcome> outcomes;

    size_t succeeded() const;
    size_t failed() const;
    nlohmann::json to_json() const;
};

// Owns the container side of every managed server: naming, health,
// cleanup, image build and the startup reconciliation pass.
// Expected runtime failures (daemon down, container missing) come back as
// false / empty values; only image pull failures propagate.
class ContainerManager {
public:
    ContainerManager(ContainerRuntime& runtime, Store& store, const Config& config);

    ContainerManager(const ContainerManager&) = delete;
    ContainerManager& operator=(const ContainerManager&) = delete;

    bool is_docker_running();

    std::string image_tag(const Server& server) const;
    static std::string container_name(const std::string& server_id);

    HealthVerdict health(const Server& server);
    bool is_healthy(const Server& server) { return health(server) == HealthVerdict::healthy; }

    // Removes the container only if it exists and is not running
    void cleanup_stopped(const std::string& name);
    // Stops (10s grace) then force-removes; removal is attempted even if stop fails
    void cleanup_existing(const std::string& name);

    bool restart(const std::string& server_id);
    std::string error_logs(const std::string& server_id, int tail = -1);

    // Pulls the image when it is not present locally. Throws ImagePullError
    // (or DockerConnectionError) when that fails.
    void ensure_image_exists(const std::string& ref);

    std::string parse_install_command(const Server& server) const;
    std::vector<std::string> parse_start_command(const Server& server) const;
    std::map<std::string, std::string> env_vars(const Server& server) const;

    // Builds <namespace>/server-<id> from the runtime base image and the
    // install command, moving the server through building -> built|failed.
    bool build_server_image(const Server& server);
    std::string dockerfile_for(const Server& server) const;

    // Reconciles every built server and mounts it through the manager.
    // Servers in `skip` are left alone and not reported. Per-server
    // failures are recorded in the report, never thrown. Once `cancelled`
    // returns true no further server is started.
    MountReport mount_built_servers(McpManager& manager, const std::set<std::string>& skip = {},
                                    const std::function<bool()>& cancelled = nullptr);

    bool is_reused(const std::string& name) const;
    std::set<std::string> reused_containers() const;

    const Config& config() const { return config_; }
    const SecretFileManager& secrets() const { return secrets_; }

private:
    ContainerRuntime& runtime_;
    Store& store_;
    Config config_;
    SecretFileManager secrets_;

    mutable std::mutex reused_mutex_;
    std::set<std::string> reused_;

    void mark_reused(const std::string& name);
    void forget_reused(const std::string& name);
    MountOutcome mount_one(const Server& server, McpManager& manager);
};

// Base image for a runtime; docker servers name their own in install_command
std::string base_image_for(const Server& server);

} // namespace mcpharbor
