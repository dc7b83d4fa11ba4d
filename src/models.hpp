#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mcpharbor {

enum class RuntimeType {
    npx,     // node package runner
    uvx,     // python tool runner
    docker,  // prebuilt container image
};

enum class BuildStatus {
    pending,
    building,
    built,
    failed,
};

enum class Permission {
    allow,
    deny,
};

enum class ToolCapability {
    read,
    write,
};

std::string to_string(RuntimeType t);
std::string to_string(BuildStatus s);
std::string to_string(Permission p);
std::string to_string(ToolCapability c);

// Parsers throw std::invalid_argument on unknown values
RuntimeType parse_runtime_type(const std::string& s);
BuildStatus parse_build_status(const std::string& s);
Permission parse_permission(const std::string& s);
ToolCapability parse_tool_capability(const std::string& s);

struct EnvVariable {
    std::string key;
    std::string value;
    bool required = false;
};

struct SecretFile {
    std::string id;
    std::string server_id;
    std::string original_filename;
    std::string stored_filename;
    std::string env_var_name;
    std::string description;
    bool active = true;
};

struct Server {
    std::string id;
    std::string name;
    std::string github_url;
    std::string description;
    RuntimeType runtime_type = RuntimeType::npx;
    std::string install_command;
    std::string start_command;
    std::vector<EnvVariable> env_variables;
    std::vector<SecretFile> secret_files;
    bool active = true;
    BuildStatus build_status = BuildStatus::pending;
    std::optional<std::string> build_error;
    std::optional<std::string> image_tag;
    std::string created_at;
};

struct Tool {
    std::string id;
    std::string server_id;
    std::string tool_name;
    std::string description;
    nlohmann::json schema;
    bool enabled = true;
    ToolCapability capability = ToolCapability::read;
    std::string created_at;
};

struct User {
    int64_t id = 0;
    std::string username;
    std::string role = "user";
};

struct PermissionOverride {
    int64_t id = 0;
    int64_t user_id = 0;
    std::string tool_id;
    Permission permission = Permission::allow;
    std::string created_at;
    std::string updated_at;
};

nlohmann::json env_variables_to_json(const std::vector<EnvVariable>& vars);
std::vector<EnvVariable> env_variables_from_json(const nlohmann::json& j);

nlohmann::json server_to_json(const Server& s);
nlohmann::json tool_to_json(const Tool& t);

} // namespace mcpharbor
