#include "container_manager.hpp"
#include "fakes.hpp"
#include "gateway.hpp"
#include "mcp_manager.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <algorithm>
#include <thread>

using namespace mcpharbor;
using namespace mcpharbor::testing;
using nlohmann::json;

class GatewayTest : public ::testing::Test {
protected:
    TempDir dir;
    Config cfg = test_config(dir);
    Store store{dir.file("harbor.db")};
    FakeRuntime runtime;
    FakeRouter router;
    ContainerManager containers{runtime, store, cfg};
    McpManager manager{router, store};
    ToolFilter filter{store};
    std::shared_ptr<HarborApp> app =
        std::make_shared<HarborApp>(containers, manager, store, filter, "X-MCP-User-Id");

    int64_t alice = 0;

    void SetUp() override {
        add_built("fs", "files", {"read", "write", "delete"});
        add_built("web", "fetch", {"get"});
        app->refresh();
        alice = store.add_user(User{0, "alice", "user"});
    }

    void add_built(const std::string& id, const std::string& name, std::vector<std::string> tools) {
        store.add_server(make_server(id, name));
        runtime.images.insert("test-ns/server-" + id);
        for (auto& t : tools) router.catalog[id].push_back(ToolDescriptor{t, t, json::object()});
    }

    std::string tool_id(const std::string& name) {
        for (auto& t : store.list_tools()) if (t.tool_name == name) return t.id;
        return "";
    }

    std::vector<std::string> listed(std::optional<int64_t> user) {
        auto reply = app->dispatch({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}, user);
        std::vector<std::string> names;
        for (auto& t : reply["result"]["tools"]) names.push_back(t["name"].get<std::string>());
        std::sort(names.begin(), names.end());
        return names;
    }

    json call(const std::string& tool, std::optional<int64_t> user) {
        return app->dispatch({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
                              {"params", {{"name", tool}, {"arguments", {{"path", "/tmp"}}}}}},
                             user);
    }
};

TEST_F(GatewayTest, RefreshPersistsNamespacedTools) {
    auto names = listed(std::nullopt);
    std::vector<std::string> expected = {"fs_delete", "fs_read", "fs_write", "web_get"};
    EXPECT_EQ(names, expected);
    EXPECT_EQ(store.list_tools().size(), 4u);
    EXPECT_EQ(app->last_report().succeeded(), 2u);
}

TEST_F(GatewayTest, InitializeAdvertisesTools) {
    auto reply = app->dispatch({{"jsonrpc", "2.0"}, {"id", "init"}, {"method", "initialize"},
                                {"params", {{"protocolVersion", "2025-03-26"}}}},
                               std::nullopt);
    EXPECT_EQ(reply["id"], "init");
    EXPECT_EQ(reply["result"]["protocolVersion"], "2025-03-26");
    EXPECT_TRUE(reply["result"]["capabilities"].contains("tools"));
    EXPECT_EQ(reply["result"]["serverInfo"]["name"], "mcpharbor");
}

TEST_F(GatewayTest, DisabledToolHiddenFromEveryone) {
    store.set_tool_enabled(tool_id("fs_delete"), false);
    std::vector<std::string> expected = {"fs_read", "fs_write", "web_get"};
    EXPECT_EQ(listed(std::nullopt), expected);
    EXPECT_EQ(listed(alice), expected);
}

TEST_F(GatewayTest, DeniedToolHiddenOnlyForThatUser) {
    store.set_permission(alice, tool_id("fs_write"), Permission::deny);
    std::vector<std::string> for_alice = {"fs_delete", "fs_read", "web_get"};
    EXPECT_EQ(listed(alice), for_alice);
    EXPECT_EQ(listed(std::nullopt).size(), 4u);
}

TEST_F(GatewayTest, AllowDoesNotOverrideGlobalDisable) {
    store.set_permission(alice, tool_id("fs_delete"), Permission::allow);
    store.set_tool_enabled(tool_id("fs_delete"), false);
    auto names = listed(alice);
    EXPECT_EQ(std::count(names.begin(), names.end(), "fs_delete"), 0);
}

TEST_F(GatewayTest, FilteredToolCannotBeCalled) {
    store.set_permission(alice, tool_id("fs_write"), Permission::deny);
    auto reply = call("fs_write", alice);
    EXPECT_EQ(reply["error"]["code"], -32602);
    EXPECT_EQ(reply["error"]["message"], "Tool not available: fs_write");
    EXPECT_TRUE(router.calls().empty());

    reply = call("fs_write", std::nullopt);
    EXPECT_TRUE(reply.contains("result"));
    EXPECT_EQ(router.calls(), std::vector<std::string>{"fs_write"});
}

TEST_F(GatewayTest, UnknownToolAndMethod) {
    auto reply = call("nope_tool", std::nullopt);
    EXPECT_EQ(reply["error"]["code"], -32602);

    reply = app->dispatch({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "resources/list"}}, std::nullopt);
    EXPECT_EQ(reply["error"]["code"], -32601);

    reply = app->dispatch({{"jsonrpc", "2.0"}, {"id", 3}}, std::nullopt);
    EXPECT_EQ(reply["error"]["code"], -32600);
}

TEST_F(GatewayTest, NotificationsGetNoReply) {
    auto reply = app->dispatch({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}, std::nullopt);
    EXPECT_TRUE(reply.is_null());
}

TEST_F(GatewayTest, IdentityHeaderMustBePositiveInteger) {
    httplib::Request req;
    EXPECT_FALSE(app->identity(req).has_value());

    req.set_header("X-MCP-User-Id", "42");
    EXPECT_EQ(app->identity(req).value_or(0), 42);

    for (auto bad : {"0", "-3", "abc", "12abc", ""}) {
        httplib::Request r;
        r.set_header("X-MCP-User-Id", bad);
        EXPECT_FALSE(app->identity(r).has_value()) << bad;
    }
}

TEST_F(GatewayTest, HandleUsesHeaderIdentity) {
    store.set_permission(alice, tool_id("web_get"), Permission::deny);

    httplib::Request req;
    req.body = json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}.dump();
    req.set_header("X-MCP-User-Id", std::to_string(alice));
    httplib::Response res;
    app->handle(req, res);

    ASSERT_EQ(res.status, 200);
    auto body = json::parse(res.body);
    EXPECT_EQ(body["result"]["tools"].size(), 3u);
}

TEST_F(GatewayTest, HandleBatchesAndParseErrors) {
    httplib::Request req;
    req.body = json::array({
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}},
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
        {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}}
    }).dump();
    httplib::Response res;
    app->handle(req, res);
    ASSERT_EQ(res.status, 200);
    EXPECT_EQ(json::parse(res.body).size(), 2u);

    httplib::Request bad;
    bad.body = "{oops";
    httplib::Response bad_res;
    app->handle(bad, bad_res);
    EXPECT_EQ(bad_res.status, 400);
    EXPECT_EQ(json::parse(bad_res.body)["error"]["code"], -32700);

    httplib::Request note;
    note.body = json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}.dump();
    httplib::Response note_res;
    app->handle(note, note_res);
    EXPECT_EQ(note_res.status, 202);
}

TEST_F(GatewayTest, RefreshUnmountsRemovedServersAndSkipsMounted) {
    store.delete_server("web");
    add_built("time", "clock", {"now"});
    auto report = app->refresh();

    ASSERT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].server_id, "time");
    auto ids = manager.server_ids();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<std::string>{"fs", "time"}));
}

TEST_F(GatewayTest, RunMountsThenUnmountsOnShutdown) {
    router.unmount_all();
    LifespanConfig lc;
    lc.startup_timeout = 5;
    lc.shutdown_timeout = 5;
    LifespanWrapper lifespan(app, lc);
    lifespan.ensure_started();
    EXPECT_EQ(manager.server_count(), 2u);
    lifespan.shutdown();
    EXPECT_EQ(manager.server_count(), 0u);
}

// ── HTTP surface ──

class GatewayHttpTest : public GatewayTest {
protected:
    std::unique_ptr<LifespanWrapper> lifespan;
    std::unique_ptr<Gateway> gateway;
    std::thread listener;
    int port = 0;

    void SetUp() override {
        GatewayTest::SetUp();
        cfg.gateway.admin_token = "s3cret";
        LifespanConfig lc;
        lc.startup_timeout = 5;
        lc.shutdown_timeout = 5;
        lifespan = std::make_unique<LifespanWrapper>(app, lc);
        gateway = std::make_unique<Gateway>(cfg, *lifespan, *app, containers, manager, store);
        port = gateway->server().bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        listener = std::thread([this] { gateway->server().listen_after_bind(); });
    }

    void TearDown() override {
        gateway->stop();
        if (listener.joinable()) listener.join();
        lifespan->shutdown();
    }

    httplib::Client client() {
        httplib::Client cli("127.0.0.1", port);
        cli.set_read_timeout(10);
        return cli;
    }

    httplib::Headers admin() { return {{"Authorization", "Bearer s3cret"}}; }
};

TEST_F(GatewayHttpTest, HealthReportsLifespanState) {
    auto cli = client();
    auto res = cli.Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["status"], "not_started");
    EXPECT_EQ(body["docker"], true);
}

TEST_F(GatewayHttpTest, McpEndpointStartsLifespan) {
    auto cli = client();
    httplib::Headers headers = {{"X-MCP-User-Id", std::to_string(alice)}};
    auto res = cli.Post("/mcp", headers,
                        json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}.dump(),
                        "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["result"]["tools"].size(), 4u);
    EXPECT_EQ(lifespan->state(), LifespanState::running);

    auto get = cli.Get("/mcp");
    ASSERT_TRUE(get);
    EXPECT_EQ(get->status, 405);
}

TEST_F(GatewayHttpTest, AdminRequiresToken) {
    auto cli = client();
    auto res = cli.Post("/admin/refresh", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 401);

    res = cli.Post("/admin/refresh", admin(), "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
}

TEST_F(GatewayHttpTest, AdminTogglesToolAndPermission) {
    auto cli = client();
    std::string tool = tool_id("fs_read");

    auto res = cli.Post("/admin/tools/" + tool + "/enabled", admin(), R"({"enabled": false})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_FALSE(store.get_tool(tool)->enabled);

    res = cli.Post("/admin/tools/missing/enabled", admin(), R"({"enabled": true})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    std::string web = tool_id("web_get");
    res = cli.Put("/admin/users/" + std::to_string(alice) + "/permissions/" + web, admin(),
                  R"({"permission": "deny"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(store.denied_tool_names(alice), std::set<std::string>{"web_get"});

    res = cli.Put("/admin/users/999/permissions/" + web, admin(), R"({"permission": "deny"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);

    res = cli.Put("/admin/users/" + std::to_string(alice) + "/permissions/" + web, admin(),
                  R"({"permission": "maybe"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = cli.Put("/admin/users/99999999999999999999999/permissions/" + web, admin(),
                  R"({"permission": "deny"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(GatewayHttpTest, AdminDeletesServer) {
    runtime.add_container("mcp-web", "running", "test-ns/server-web");
    auto cli = client();
    auto res = cli.Delete("/admin/servers/web", admin());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_FALSE(store.get_server("web"));
    EXPECT_FALSE(runtime.has_container("mcp-web"));
    EXPECT_EQ(manager.server_ids(), std::vector<std::string>{"fs"});

    res = cli.Delete("/admin/servers/web", admin());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}
