#pragma once
#include <string>
#include <vector>
#include <set>
#include <variant>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mcpharbor {

// Where the filter gets its exclusion sets. Implementations may throw on
// infrastructure faults; the filter treats any throw as "do not filter".
class PermissionSource {
public:
    virtual ~PermissionSource() = default;

    // Names of tools switched off for everyone
    virtual std::set<std::string> disabled_tool_names() = 0;
    // Names of tools this user has an explicit deny override for
    virtual std::set<std::string> denied_tool_names(int64_t user_id) = 0;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();

    nlohmann::json to_json() const;
};

// A tool as it comes back from the router: either a structured descriptor
// or a raw protocol mapping. Mappings without a string "name" are nameless.
class UpstreamTool {
public:
    UpstreamTool(ToolDescriptor d) : value_(std::move(d)) {}
    UpstreamTool(nlohmann::json j) : value_(std::move(j)) {}

    std::optional<std::string> name() const;
    nlohmann::json to_json() const;

    bool is_descriptor() const { return std::holds_alternative<ToolDescriptor>(value_); }

private:
    std::variant<ToolDescriptor, nlohmann::json> value_;
};

class ToolFilter {
public:
    explicit ToolFilter(PermissionSource& source) : source_(source) {}

    // Anonymous callers lose globally disabled tools only; authenticated
    // callers also lose their denied tools. Returns the input unchanged if
    // the source fails.
    std::vector<UpstreamTool> filter(const std::vector<UpstreamTool>& tools,
                                     std::optional<int64_t> user_id) const;

    // Same rule for a single tool name. Fails open like filter().
    bool is_allowed(const std::string& tool_name, std::optional<int64_t> user_id) const;

private:
    PermissionSource& source_;

    std::set<std::string> excluded(std::optional<int64_t> user_id) const;
};

} // namespace mcpharbor
