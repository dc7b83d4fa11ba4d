#pragma once
#include "models.hpp"
#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace mcpharbor {

class ContainerManager;
enum class HealthVerdict;

// Process the router spawns to talk stdio MCP with a server's container.
// Environment values travel in `env` and reach the container through
// bare `-e KEY` arguments, so secrets never show up in argv.
struct LaunchConfig {
    std::string key;                           // "existing" or "new"
    std::string command = "docker";
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    bool attaches() const { return key == "existing"; }

    // { "<key>": { "command": ..., "args": [...], "env": {...} } }
    nlohmann::json to_json() const;
};

// Exec into the running container when it is healthy, otherwise run a
// fresh one from the server's image.
LaunchConfig build_config(ContainerManager& containers, const Server& server);
// Same, for a verdict the caller already acted on
LaunchConfig build_config(ContainerManager& containers, const Server& server, HealthVerdict verdict);

} // namespace mcpharbor
