#include "models.hpp"
#include <stdexcept>

namespace mcpharbor {

std::string to_string(RuntimeType t) {
    switch (t) {
        case RuntimeType::npx:    return "npx";
        case RuntimeType::uvx:    return "uvx";
        case RuntimeType::docker: return "docker";
    }
    return "npx";
}

std::string to_string(BuildStatus s) {
    switch (s) {
        case BuildStatus::pending:  return "pending";
        case BuildStatus::building: return "building";
        case BuildStatus::built:    return "built";
        case BuildStatus::failed:   return "failed";
    }
    return "pending";
}

std::string to_string(Permission p) {
    return p == Permission::deny ? "deny" : "allow";
}

std::string to_string(ToolCapability c) {
    return c == ToolCapability::write ? "write" : "read";
}

RuntimeType parse_runtime_type(const std::string& s) {
    if (s == "npx")    return RuntimeType::npx;
    if (s == "uvx")    return RuntimeType::uvx;
    if (s == "docker") return RuntimeType::docker;
    throw std::invalid_argument("unknown runtime type: " + s);
}

BuildStatus parse_build_status(const std::string& s) {
    if (s == "pending")  return BuildStatus::pending;
    if (s == "building") return BuildStatus::building;
    if (s == "built")    return BuildStatus::built;
    if (s == "failed")   return BuildStatus::failed;
    throw std::invalid_argument("unknown build status: " + s);
}

Permission parse_permission(const std::string& s) {
    if (s == "allow") return Permission::allow;
    if (s == "deny")  return Permission::deny;
    throw std::invalid_argument("unknown permission: " + s);
}

ToolCapability parse_tool_capability(const std::string& s) {
    if (s == "read")  return ToolCapability::read;
    if (s == "write") return ToolCapability::write;
    throw std::invalid_argument("unknown tool capability: " + s);
}

nlohmann::json env_variables_to_json(const std::vector<EnvVariable>& vars) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& v : vars) {
        arr.push_back({{"key", v.key}, {"value", v.value}, {"required", v.required}});
    }
    return arr;
}

std::vector<EnvVariable> env_variables_from_json(const nlohmann::json& j) {
    std::vector<EnvVariable> vars;
    if (!j.is_array()) return vars;
    for (auto& item : j) {
        if (!item.is_object()) continue;
        EnvVariable v;
        v.key = item.value("key", "");
        v.value = item.value("value", "");
        v.required = item.value("required", false);
        if (!v.key.empty()) vars.push_back(std::move(v));
    }
    return vars;
}

nlohmann::json server_to_json(const Server& s) {
    nlohmann::json j = {
        {"id", s.id},
        {"name", s.name},
        {"github_url", s.github_url},
        {"description", s.description},
        {"runtime_type", to_string(s.runtime_type)},
        {"install_command", s.install_command},
        {"start_command", s.start_command},
        {"is_active", s.active},
        {"build_status", to_string(s.build_status)},
        {"created_at", s.created_at}
    };
    // Values stay server side; only the keys are exposed
    nlohmann::json keys = nlohmann::json::array();
    for (auto& v : s.env_variables) keys.push_back(v.key);
    j["env_keys"] = keys;
    j["build_error"] = s.build_error ? nlohmann::json(*s.build_error) : nlohmann::json();
    j["image_tag"] = s.image_tag ? nlohmann::json(*s.image_tag) : nlohmann::json();
    return j;
}

nlohmann::json tool_to_json(const Tool& t) {
    return {
        {"id", t.id},
        {"server_id", t.server_id},
        {"tool_name", t.tool_name},
        {"description", t.description},
        {"schema", t.schema},
        {"is_enabled", t.enabled},
        {"tool_capability", to_string(t.capability)}
    };
}

} // namespace mcpharbor
