#include "tool_filter.hpp"
#include <iostream>

namespace mcpharbor {

nlohmann::json ToolDescriptor::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema.is_null() ? nlohmann::json::object() : input_schema}
    };
}

std::optional<std::string> UpstreamTool::name() const {
    if (auto d = std::get_if<ToolDescriptor>(&value_)) {
        if (d->name.empty()) return std::nullopt;
        return d->name;
    }
    auto& j = std::get<nlohmann::json>(value_);
    if (j.is_object() && j.contains("name") && j["name"].is_string()) {
        return j["name"].get<std::string>();
    }
    return std::nullopt;
}

nlohmann::json UpstreamTool::to_json() const {
    if (auto d = std::get_if<ToolDescriptor>(&value_)) return d->to_json();
    return std::get<nlohmann::json>(value_);
}

std::set<std::string> ToolFilter::excluded(std::optional<int64_t> user_id) const {
    auto names = source_.disabled_tool_names();
    if (user_id) {
        auto denied = source_.denied_tool_names(*user_id);
        names.insert(denied.begin(), denied.end());
    }
    return names;
}

std::vector<UpstreamTool> ToolFilter::filter(const std::vector<UpstreamTool>& tools,
                                             std::optional<int64_t> user_id) const {
    std::set<std::string> hidden;
    try {
        hidden = excluded(user_id);
    } catch (const std::exception& e) {
        std::cerr << "[filter] Permission lookup failed, returning unfiltered tools: " << e.what() << "\n";
        return tools;
    }
    if (hidden.empty()) return tools;

    std::vector<UpstreamTool> out;
    out.reserve(tools.size());
    for (auto& t : tools) {
        auto n = t.name();
        if (n && hidden.count(*n)) continue;
        out.push_back(t);
    }
    if (out.size() != tools.size()) {
        std::cerr << "[filter] Hid " << (tools.size() - out.size()) << " of " << tools.size() << " tools"
                  << (user_id ? " for user " + std::to_string(*user_id) : std::string(" (anonymous)")) << "\n";
    }
    return out;
}

bool ToolFilter::is_allowed(const std::string& tool_name, std::optional<int64_t> user_id) const {
    try {
        return excluded(user_id).count(tool_name) == 0;
    } catch (const std::exception& e) {
        std::cerr << "[filter] Permission lookup failed, allowing " << tool_name << ": " << e.what() << "\n";
        return true;
    }
}

} // namespace mcpharbor
