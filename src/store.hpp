#pragma once
#include "models.hpp"
#include "tool_filter.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <cstdint>

struct sqlite3;

namespace mcpharbor {

// Scoped database session: opens its own connection and transaction,
// commits on commit(), rolls back if destroyed without one.
class Session {
public:
    explicit Session(const std::string& db_path);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void commit();
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    bool done_ = false;
};

// SQLite-backed store for servers, tools, secret files, users and
// per-user tool permission overrides.
class Store : public PermissionSource {
public:
    explicit Store(const std::string& db_path);

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    const std::string& path() const { return db_path_; }

    // ── Servers ──
    std::string add_server(Server server);
    std::optional<Server> get_server(const std::string& id);
    std::vector<Server> list_servers();
    std::vector<Server> list_built_servers();
    void update_build_status(const std::string& id, BuildStatus status,
                             const std::optional<std::string>& error = std::nullopt);
    void set_image_tag(const std::string& id, const std::string& tag);
    bool delete_server(const std::string& id);

    // ── Secret files ──
    std::string add_secret_file(SecretFile file);
    std::vector<SecretFile> secret_files(const std::string& server_id);

    // ── Tools ──
    // Create-or-update by tool_name; keeps the enabled flag of existing rows.
    size_t store_server_tools(const std::string& server_id, const std::vector<Tool>& tools);
    std::vector<Tool> list_tools(const std::optional<std::string>& server_id = std::nullopt);
    std::optional<Tool> get_tool(const std::string& id);
    bool set_tool_enabled(const std::string& id, bool enabled);
    bool delete_tool(const std::string& id);
    // Server name -> its tools, ordered by tool name
    std::map<std::string, std::vector<Tool>> tools_by_server();

    // ── Users ──
    int64_t add_user(const User& user);
    bool delete_user(int64_t id);
    std::vector<User> list_users();

    // ── Permission overrides ──
    // Strict insert; throws IntegrityError when (user, tool) already exists.
    int64_t insert_permission(int64_t user_id, const std::string& tool_id, Permission permission);
    // Create or update the override (admin toggle).
    void set_permission(int64_t user_id, const std::string& tool_id, Permission permission);
    std::optional<PermissionOverride> get_permission(int64_t user_id, const std::string& tool_id);
    std::vector<PermissionOverride> list_permissions(int64_t user_id);
    // Every tool with the user's decision; tools without an override are allowed.
    std::vector<std::pair<Tool, Permission>> effective_permissions(int64_t user_id);

    // PermissionSource
    std::set<std::string> disabled_tool_names() override;
    std::set<std::string> denied_tool_names(int64_t user_id) override;

private:
    std::string db_path_;

    void init_db();
    std::vector<Server> query_servers(const std::string& where,
                                      const std::optional<std::string>& param = std::nullopt);
};

} // namespace mcpharbor
