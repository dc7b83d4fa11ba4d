#include "store.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <iostream>

namespace mcpharbor {

namespace {

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if ((rc & 0xff) == SQLITE_CONSTRAINT) throw IntegrityError(msg);
    throw StoreError(msg);
}

// Prepared statement owned for one scope
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) throw_sqlite(db_, rc, "prepare failed");
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT);
        return *this;
    }
    Statement& bind(int idx, const char* v) {
        sqlite3_bind_text(stmt_, idx, v, -1, SQLITE_TRANSIENT);
        return *this;
    }
    Statement& bind(int idx, int64_t v) {
        sqlite3_bind_int64(stmt_, idx, v);
        return *this;
    }
    Statement& bind(int idx, bool v) {
        sqlite3_bind_int(stmt_, idx, v ? 1 : 0);
        return *this;
    }
    Statement& bind(int idx, const std::optional<std::string>& v) {
        if (v) sqlite3_bind_text(stmt_, idx, v->c_str(), -1, SQLITE_TRANSIENT);
        else sqlite3_bind_null(stmt_, idx);
        return *this;
    }

    // true while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw_sqlite(db_, rc, "step failed");
    }

    void run() {
        while (step()) {}
    }

    std::string text(int col) const {
        auto p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    std::optional<std::string> optional_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    bool boolean(int col) const { return sqlite3_column_int(stmt_, col) != 0; }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) throw IntegrityError(msg);
        throw StoreError(msg);
    }
}

const char* kToolColumns =
    "t.id, t.server_id, t.tool_name, t.tool_description, t.tool_schema, "
    "t.is_enabled, t.tool_capability, t.created_at";

Tool read_tool(const Statement& st, int offset = 0) {
    Tool t;
    t.id = st.text(offset + 0);
    t.server_id = st.text(offset + 1);
    t.tool_name = st.text(offset + 2);
    t.description = st.text(offset + 3);
    std::string schema = st.text(offset + 4);
    t.schema = schema.empty() ? nlohmann::json::object()
                              : nlohmann::json::parse(schema, nullptr, false);
    if (t.schema.is_discarded()) t.schema = nlohmann::json::object();
    t.enabled = st.boolean(offset + 5);
    try {
        t.capability = parse_tool_capability(st.text(offset + 6));
    } catch (const std::invalid_argument&) {
        t.capability = ToolCapability::read;
    }
    t.created_at = st.text(offset + 7);
    return t;
}

PermissionOverride read_permission(const Statement& st) {
    PermissionOverride p;
    p.id = st.int64(0);
    p.user_id = st.int64(1);
    p.tool_id = st.text(2);
    p.permission = parse_permission(st.text(3));
    p.created_at = st.text(4);
    p.updated_at = st.text(5);
    return p;
}

} // namespace

// ── Session ──

Session::Session(const std::string& db_path) {
    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open database " + db_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        exec(db_, "PRAGMA foreign_keys = ON");
        exec(db_, "BEGIN IMMEDIATE");
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

Session::~Session() {
    if (!db_) return;
    if (!done_) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[store] Rollback failed: " << (err ? err : "unknown error") << "\n";
            sqlite3_free(err);
        }
    }
    sqlite3_close(db_);
}

void Session::commit() {
    exec(db_, "COMMIT");
    done_ = true;
}

// ── Store ──

Store::Store(const std::string& db_path) : db_path_(db_path) {
    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    init_db();
}

void Store::init_db() {
    Session s(db_path_);
    exec(s.handle(), R"(
        CREATE TABLE IF NOT EXISTS mcp_servers (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL UNIQUE,
            github_url TEXT NOT NULL,
            description TEXT,
            runtime_type TEXT NOT NULL,
            install_command TEXT NOT NULL DEFAULT '',
            start_command TEXT NOT NULL,
            env_variables TEXT NOT NULL DEFAULT '[]',
            is_active INTEGER NOT NULL DEFAULT 1,
            created_at TEXT NOT NULL,
            build_status TEXT NOT NULL DEFAULT 'pending',
            build_error TEXT,
            image_tag TEXT
        );
        CREATE TABLE IF NOT EXISTS mcp_server_tools (
            id TEXT PRIMARY KEY,
            server_id TEXT NOT NULL REFERENCES mcp_servers(id) ON DELETE CASCADE,
            tool_name TEXT NOT NULL UNIQUE,
            tool_description TEXT,
            tool_schema TEXT,
            is_enabled INTEGER NOT NULL DEFAULT 1,
            tool_capability TEXT NOT NULL DEFAULT 'read',
            created_at TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS mcp_server_secret_files (
            id TEXT PRIMARY KEY,
            server_id TEXT NOT NULL REFERENCES mcp_servers(id) ON DELETE CASCADE,
            original_filename TEXT NOT NULL,
            stored_filename TEXT NOT NULL,
            env_var_name TEXT NOT NULL,
            description TEXT,
            is_active INTEGER NOT NULL DEFAULT 1,
            created_at TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            username TEXT NOT NULL UNIQUE,
            role TEXT NOT NULL DEFAULT 'user',
            created_at TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS user_tool_permissions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,
            tool_id TEXT NOT NULL REFERENCES mcp_server_tools(id) ON DELETE CASCADE,
            permission TEXT NOT NULL CHECK (permission IN ('allow', 'deny')),
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL,
            CONSTRAINT uq_user_tool UNIQUE (user_id, tool_id)
        );
        CREATE INDEX IF NOT EXISTS idx_user_tool_permissions_tool ON user_tool_permissions(tool_id);
        CREATE INDEX IF NOT EXISTS idx_user_tool_permissions_user ON user_tool_permissions(user_id);
        CREATE INDEX IF NOT EXISTS idx_mcp_server_tools_server ON mcp_server_tools(server_id);
    )");
    s.commit();
}

// ── Servers ──

std::string Store::add_server(Server server) {
    if (server.id.empty()) server.id = generate_id();
    if (server.created_at.empty()) server.created_at = timestamp_now();

    Session s(db_path_);
    Statement st(s.handle(),
        "INSERT INTO mcp_servers (id, name, github_url, description, runtime_type, "
        "install_command, start_command, env_variables, is_active, created_at, "
        "build_status, build_error, image_tag) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, server.id)
      .bind(2, server.name)
      .bind(3, server.github_url)
      .bind(4, server.description)
      .bind(5, to_string(server.runtime_type))
      .bind(6, server.install_command)
      .bind(7, server.start_command)
      .bind(8, env_variables_to_json(server.env_variables).dump())
      .bind(9, server.active)
      .bind(10, server.created_at)
      .bind(11, to_string(server.build_status))
      .bind(12, server.build_error)
      .bind(13, server.image_tag);
    st.run();
    s.commit();
    return server.id;
}

std::vector<Server> Store::query_servers(const std::string& where,
                                         const std::optional<std::string>& param) {
    std::string sql =
        "SELECT id, name, github_url, description, runtime_type, install_command, "
        "start_command, env_variables, is_active, created_at, build_status, build_error, "
        "image_tag FROM mcp_servers " + where + " ORDER BY name";

    Session s(db_path_);
    std::vector<Server> servers;
    {
        Statement st(s.handle(), sql.c_str());
        if (param) st.bind(1, *param);
        while (st.step()) {
            Server srv;
            srv.id = st.text(0);
            srv.name = st.text(1);
            srv.github_url = st.text(2);
            srv.description = st.text(3);
            srv.runtime_type = parse_runtime_type(st.text(4));
            srv.install_command = st.text(5);
            srv.start_command = st.text(6);
            srv.env_variables = env_variables_from_json(
                nlohmann::json::parse(st.text(7), nullptr, false));
            srv.active = st.boolean(8);
            srv.created_at = st.text(9);
            srv.build_status = parse_build_status(st.text(10));
            srv.build_error = st.optional_text(11);
            srv.image_tag = st.optional_text(12);
            servers.push_back(std::move(srv));
        }
    }

    for (auto& srv : servers) {
        Statement fst(s.handle(),
            "SELECT id, server_id, original_filename, stored_filename, env_var_name, "
            "description, is_active FROM mcp_server_secret_files WHERE server_id = ? "
            "ORDER BY created_at, id");
        fst.bind(1, srv.id);
        while (fst.step()) {
            SecretFile f;
            f.id = fst.text(0);
            f.server_id = fst.text(1);
            f.original_filename = fst.text(2);
            f.stored_filename = fst.text(3);
            f.env_var_name = fst.text(4);
            f.description = fst.text(5);
            f.active = fst.boolean(6);
            srv.secret_files.push_back(std::move(f));
        }
    }
    s.commit();
    return servers;
}

std::optional<Server> Store::get_server(const std::string& id) {
    auto servers = query_servers("WHERE id = ?", id);
    if (servers.empty()) return std::nullopt;
    return std::move(servers.front());
}

std::vector<Server> Store::list_servers() {
    return query_servers("");
}

std::vector<Server> Store::list_built_servers() {
    return query_servers("WHERE build_status = 'built' AND is_active = 1");
}

void Store::update_build_status(const std::string& id, BuildStatus status,
                                const std::optional<std::string>& error) {
    Session s(db_path_);
    Statement st(s.handle(), "UPDATE mcp_servers SET build_status = ?, build_error = ? WHERE id = ?");
    st.bind(1, to_string(status)).bind(2, error).bind(3, id);
    st.run();
    s.commit();
}

void Store::set_image_tag(const std::string& id, const std::string& tag) {
    Session s(db_path_);
    Statement st(s.handle(), "UPDATE mcp_servers SET image_tag = ? WHERE id = ?");
    st.bind(1, tag).bind(2, id);
    st.run();
    s.commit();
}

bool Store::delete_server(const std::string& id) {
    Session s(db_path_);
    Statement st(s.handle(), "DELETE FROM mcp_servers WHERE id = ?");
    st.bind(1, id);
    st.run();
    int changes = sqlite3_changes(s.handle());
    s.commit();
    return changes > 0;
}

// ── Secret files ──

std::string Store::add_secret_file(SecretFile file) {
    if (file.id.empty()) file.id = generate_id();
    Session s(db_path_);
    Statement st(s.handle(),
        "INSERT INTO mcp_server_secret_files (id, server_id, original_filename, stored_filename, "
        "env_var_name, description, is_active, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    st.bind(1, file.id)
      .bind(2, file.server_id)
      .bind(3, file.original_filename)
      .bind(4, file.stored_filename)
      .bind(5, file.env_var_name)
      .bind(6, file.description)
      .bind(7, file.active)
      .bind(8, timestamp_now());
    st.run();
    s.commit();
    return file.id;
}

std::vector<SecretFile> Store::secret_files(const std::string& server_id) {
    auto srv = get_server(server_id);
    if (!srv) return {};
    return srv->secret_files;
}

// ── Tools ──

size_t Store::store_server_tools(const std::string& server_id, const std::vector<Tool>& tools) {
    Session s(db_path_);
    size_t stored = 0;
    for (auto& t : tools) {
        if (t.tool_name.empty()) continue;

        std::optional<std::string> existing;
        {
            Statement find(s.handle(), "SELECT id FROM mcp_server_tools WHERE tool_name = ?");
            find.bind(1, t.tool_name);
            if (find.step()) existing = find.text(0);
        }

        if (existing) {
            Statement up(s.handle(),
                "UPDATE mcp_server_tools SET server_id = ?, tool_description = ?, tool_schema = ? "
                "WHERE id = ?");
            up.bind(1, server_id).bind(2, t.description).bind(3, t.schema.dump()).bind(4, *existing);
            up.run();
        } else {
            Statement ins(s.handle(),
                "INSERT INTO mcp_server_tools (id, server_id, tool_name, tool_description, "
                "tool_schema, is_enabled, tool_capability, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
            ins.bind(1, t.id.empty() ? generate_id() : t.id)
               .bind(2, server_id)
               .bind(3, t.tool_name)
               .bind(4, t.description)
               .bind(5, t.schema.dump())
               .bind(6, t.enabled)
               .bind(7, to_string(t.capability))
               .bind(8, timestamp_now());
            ins.run();
        }
        stored++;
    }
    s.commit();
    return stored;
}

std::vector<Tool> Store::list_tools(const std::optional<std::string>& server_id) {
    std::string sql = std::string("SELECT ") + kToolColumns + " FROM mcp_server_tools t";
    if (server_id) sql += " WHERE t.server_id = ?";
    sql += " ORDER BY t.tool_name";

    Session s(db_path_);
    std::vector<Tool> tools;
    {
        Statement st(s.handle(), sql.c_str());
        if (server_id) st.bind(1, *server_id);
        while (st.step()) tools.push_back(read_tool(st));
    }
    s.commit();
    return tools;
}

std::optional<Tool> Store::get_tool(const std::string& id) {
    std::string sql = std::string("SELECT ") + kToolColumns + " FROM mcp_server_tools t WHERE t.id = ?";
    Session s(db_path_);
    std::optional<Tool> tool;
    {
        Statement st(s.handle(), sql.c_str());
        st.bind(1, id);
        if (st.step()) tool = read_tool(st);
    }
    s.commit();
    return tool;
}

bool Store::set_tool_enabled(const std::string& id, bool enabled) {
    Session s(db_path_);
    Statement st(s.handle(), "UPDATE mcp_server_tools SET is_enabled = ? WHERE id = ?");
    st.bind(1, enabled).bind(2, id);
    st.run();
    int changes = sqlite3_changes(s.handle());
    s.commit();
    return changes > 0;
}

bool Store::delete_tool(const std::string& id) {
    Session s(db_path_);
    Statement st(s.handle(), "DELETE FROM mcp_server_tools WHERE id = ?");
    st.bind(1, id);
    st.run();
    int changes = sqlite3_changes(s.handle());
    s.commit();
    return changes > 0;
}

std::map<std::string, std::vector<Tool>> Store::tools_by_server() {
    std::string sql = std::string("SELECT s.name, ") + kToolColumns +
        " FROM mcp_server_tools t JOIN mcp_servers s ON s.id = t.server_id"
        " ORDER BY s.name, t.tool_name";
    Session s(db_path_);
    std::map<std::string, std::vector<Tool>> grouped;
    {
        Statement st(s.handle(), sql.c_str());
        while (st.step()) grouped[st.text(0)].push_back(read_tool(st, 1));
    }
    s.commit();
    return grouped;
}

// ── Users ──

int64_t Store::add_user(const User& user) {
    Session s(db_path_);
    Statement st(s.handle(), "INSERT INTO users (username, role, created_at) VALUES (?, ?, ?)");
    st.bind(1, user.username).bind(2, user.role).bind(3, timestamp_now());
    st.run();
    int64_t id = sqlite3_last_insert_rowid(s.handle());
    s.commit();
    return id;
}

bool Store::delete_user(int64_t id) {
    Session s(db_path_);
    Statement st(s.handle(), "DELETE FROM users WHERE id = ?");
    st.bind(1, id);
    st.run();
    int changes = sqlite3_changes(s.handle());
    s.commit();
    return changes > 0;
}

std::vector<User> Store::list_users() {
    Session s(db_path_);
    std::vector<User> users;
    {
        Statement st(s.handle(), "SELECT id, username, role FROM users ORDER BY id");
        while (st.step()) {
            users.push_back(User{st.int64(0), st.text(1), st.text(2)});
        }
    }
    s.commit();
    return users;
}

// ── Permission overrides ──

int64_t Store::insert_permission(int64_t user_id, const std::string& tool_id, Permission permission) {
    std::string now = timestamp_now();
    Session s(db_path_);
    Statement st(s.handle(),
        "INSERT INTO user_tool_permissions (user_id, tool_id, permission, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?)");
    st.bind(1, user_id).bind(2, tool_id).bind(3, to_string(permission)).bind(4, now).bind(5, now);
    // A constraint failure throws here; the session destructor rolls back.
    st.run();
    int64_t id = sqlite3_last_insert_rowid(s.handle());
    s.commit();
    return id;
}

void Store::set_permission(int64_t user_id, const std::string& tool_id, Permission permission) {
    std::string now = timestamp_now();
    Session s(db_path_);
    Statement st(s.handle(),
        "INSERT INTO user_tool_permissions (user_id, tool_id, permission, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?) "
        "ON CONFLICT (user_id, tool_id) DO UPDATE SET "
        "permission = excluded.permission, updated_at = excluded.updated_at");
    st.bind(1, user_id).bind(2, tool_id).bind(3, to_string(permission)).bind(4, now).bind(5, now);
    st.run();
    s.commit();
    std::cerr << "[store] Tool permission updated: user_id=" << user_id
              << ", tool_id=" << tool_id << ", permission=" << to_string(permission) << "\n";
}

std::optional<PermissionOverride> Store::get_permission(int64_t user_id, const std::string& tool_id) {
    Session s(db_path_);
    std::optional<PermissionOverride> perm;
    {
        Statement st(s.handle(),
            "SELECT id, user_id, tool_id, permission, created_at, updated_at "
            "FROM user_tool_permissions WHERE user_id = ? AND tool_id = ?");
        st.bind(1, user_id).bind(2, tool_id);
        if (st.step()) perm = read_permission(st);
    }
    s.commit();
    return perm;
}

std::vector<PermissionOverride> Store::list_permissions(int64_t user_id) {
    Session s(db_path_);
    std::vector<PermissionOverride> perms;
    {
        Statement st(s.handle(),
            "SELECT id, user_id, tool_id, permission, created_at, updated_at "
            "FROM user_tool_permissions WHERE user_id = ? ORDER BY id");
        st.bind(1, user_id);
        while (st.step()) perms.push_back(read_permission(st));
    }
    s.commit();
    return perms;
}

std::vector<std::pair<Tool, Permission>> Store::effective_permissions(int64_t user_id) {
    std::string sql = std::string("SELECT ") + kToolColumns + ", p.permission"
        " FROM mcp_server_tools t LEFT JOIN user_tool_permissions p"
        " ON p.tool_id = t.id AND p.user_id = ?"
        " ORDER BY t.tool_name";
    Session s(db_path_);
    std::vector<std::pair<Tool, Permission>> result;
    {
        Statement st(s.handle(), sql.c_str());
        st.bind(1, user_id);
        while (st.step()) {
            auto decision = st.optional_text(8);
            result.emplace_back(read_tool(st),
                                decision ? parse_permission(*decision) : Permission::allow);
        }
    }
    s.commit();
    return result;
}

std::set<std::string> Store::disabled_tool_names() {
    Session s(db_path_);
    std::set<std::string> names;
    {
        Statement st(s.handle(), "SELECT tool_name FROM mcp_server_tools WHERE is_enabled = 0");
        while (st.step()) names.insert(st.text(0));
    }
    s.commit();
    return names;
}

std::set<std::string> Store::denied_tool_names(int64_t user_id) {
    Session s(db_path_);
    std::set<std::string> names;
    {
        Statement st(s.handle(),
            "SELECT t.tool_name FROM mcp_server_tools t "
            "JOIN user_tool_permissions p ON p.tool_id = t.id "
            "WHERE p.user_id = ? AND p.permission = 'deny'");
        st.bind(1, user_id);
        while (st.step()) names.insert(st.text(0));
    }
    s.commit();
    return names;
}

} // namespace mcpharbor
