#include "container_manager.hpp"
#include "fakes.hpp"
#include "mcp_manager.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace mcpharbor;
using namespace mcpharbor::testing;

class MountTest : public ::testing::Test {
protected:
    TempDir dir;
    Config cfg = test_config(dir);
    Store store{dir.file("harbor.db")};
    FakeRuntime runtime;
    FakeRouter router;
    ContainerManager containers{runtime, store, cfg};
    McpManager manager{router, store};

    void add_built(const std::string& id, const std::string& name, std::vector<std::string> tools = {}) {
        store.add_server(make_server(id, name));
        runtime.images.insert("test-ns/server-" + id);
        for (auto& t : tools) router.catalog[id].push_back(ToolDescriptor{t, t + " tool", nlohmann::json::object()});
    }

    const MountOutcome* outcome(const MountReport& r, const std::string& id) {
        for (auto& o : r.outcomes) if (o.server_id == id) return &o;
        return nullptr;
    }
};

TEST_F(MountTest, NoBuiltServersYieldsEmptyReport) {
    store.add_server(make_server("p1", "pending", RuntimeType::npx, BuildStatus::pending));
    auto report = containers.mount_built_servers(manager);
    EXPECT_TRUE(report.outcomes.empty());
    EXPECT_TRUE(router.mounted().empty());
}

TEST_F(MountTest, MountsEveryBuiltServerAndPersistsTools) {
    add_built("s1", "fetch", {"get", "head"});
    add_built("s2", "time", {"now"});

    auto report = containers.mount_built_servers(manager);
    EXPECT_EQ(report.succeeded(), 2u);
    EXPECT_EQ(report.failed(), 0u);
    EXPECT_EQ(manager.server_count(), 2u);

    auto tools = store.list_tools();
    std::vector<std::string> names;
    for (auto& t : tools) names.push_back(t.tool_name);
    std::sort(names.begin(), names.end());
    std::vector<std::string> expected = {"s1_get", "s1_head", "s2_now"};
    EXPECT_EQ(names, expected);
    EXPECT_EQ(outcome(report, "s1")->tool_count, 2u);
}

TEST_F(MountTest, OneFailureDoesNotBlockOthers) {
    add_built("s1", "good", {"a"});
    add_built("s2", "bad", {"b"});
    add_built("s3", "also-good", {"c"});
    router.failing.insert("s2");

    auto report = containers.mount_built_servers(manager);
    EXPECT_EQ(report.outcomes.size(), 3u);
    EXPECT_EQ(report.succeeded(), 2u);
    ASSERT_NE(outcome(report, "s2"), nullptr);
    EXPECT_FALSE(outcome(report, "s2")->ok);
    EXPECT_NE(outcome(report, "s2")->error.find("failed to start"), std::string::npos);
    EXPECT_TRUE(outcome(report, "s1")->ok);
    EXPECT_TRUE(outcome(report, "s3")->ok);
}

TEST_F(MountTest, MissingImageThatCannotBePulledFailsThatServerOnly) {
    store.add_server(make_server("s1", "unbuilt-image"));
    add_built("s2", "fine", {"x"});
    runtime.fail_pull = true;

    auto report = containers.mount_built_servers(manager);
    EXPECT_FALSE(outcome(report, "s1")->ok);
    EXPECT_TRUE(outcome(report, "s2")->ok);
    EXPECT_EQ(manager.server_ids(), std::vector<std::string>{"s2"});
}

TEST_F(MountTest, HealthyContainerIsReusedAndAttached) {
    add_built("s1", "fetch", {"get"});
    runtime.add_container("mcp-s1", "running", "test-ns/server-s1");

    auto report = containers.mount_built_servers(manager);
    EXPECT_TRUE(outcome(report, "s1")->reused);
    EXPECT_TRUE(containers.is_reused("mcp-s1"));
    EXPECT_EQ(router.launch_for("s1").key, "existing");
    EXPECT_EQ(runtime.count("remove"), 0);
}

TEST_F(MountTest, UnhealthyContainerIsReplaced) {
    add_built("s1", "fetch", {"get"});
    runtime.add_container("mcp-s1", "exited", "test-ns/server-s1");

    auto report = containers.mount_built_servers(manager);
    EXPECT_TRUE(outcome(report, "s1")->ok);
    EXPECT_FALSE(outcome(report, "s1")->reused);
    EXPECT_FALSE(runtime.has_container("mcp-s1"));
    EXPECT_EQ(router.launch_for("s1").key, "new");
    EXPECT_TRUE(containers.reused_containers().empty());
}

TEST_F(MountTest, ContainerThatDiesAfterReuseIsReplacedNextPass) {
    add_built("s1", "fetch", {"get"});
    runtime.add_container("mcp-s1", "running", "test-ns/server-s1");
    router.failing.insert("s1");

    auto first = containers.mount_built_servers(manager);
    EXPECT_FALSE(outcome(first, "s1")->ok);
    EXPECT_TRUE(outcome(first, "s1")->reused);
    EXPECT_TRUE(containers.is_reused("mcp-s1"));

    runtime.add_container("mcp-s1", "exited", "test-ns/server-s1");
    router.failing.clear();

    auto second = containers.mount_built_servers(manager);
    EXPECT_TRUE(outcome(second, "s1")->ok);
    EXPECT_FALSE(outcome(second, "s1")->reused);
    EXPECT_FALSE(containers.is_reused("mcp-s1"));
    EXPECT_EQ(runtime.count("remove"), 1);
    EXPECT_FALSE(runtime.has_container("mcp-s1"));
    EXPECT_EQ(router.launch_for("s1").key, "new");
}

TEST_F(MountTest, CancelledPassStartsNoFurtherServers) {
    add_built("s1", "fetch", {"get"});
    add_built("s2", "time", {"now"});

    auto report = containers.mount_built_servers(manager, {}, [] { return true; });
    ASSERT_EQ(report.outcomes.size(), 2u);
    EXPECT_EQ(report.failed(), 2u);
    EXPECT_EQ(outcome(report, "s1")->error, "mount pass cancelled");
    EXPECT_TRUE(router.mounted().empty());
    EXPECT_EQ(runtime.count("get"), 0);
}

TEST_F(MountTest, SkippedServersAreLeftAlone) {
    add_built("s1", "fetch", {"get"});
    add_built("s2", "time", {"now"});

    auto report = containers.mount_built_servers(manager, {"s1"});
    EXPECT_EQ(report.outcomes.size(), 1u);
    EXPECT_EQ(report.outcomes[0].server_id, "s2");
    EXPECT_THROW(router.launch_for("s1"), std::out_of_range);
}

TEST_F(MountTest, RemountKeepsToolEnabledFlag) {
    add_built("s1", "fetch", {"get"});
    containers.mount_built_servers(manager);
    auto tools = store.list_tools();
    ASSERT_EQ(tools.size(), 1u);
    store.set_tool_enabled(tools[0].id, false);

    containers.mount_built_servers(manager);
    tools = store.list_tools();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_FALSE(tools[0].enabled);
}

TEST_F(MountTest, ServerWithoutToolsStillMounts) {
    add_built("s1", "quiet");
    auto report = containers.mount_built_servers(manager);
    EXPECT_TRUE(outcome(report, "s1")->ok);
    EXPECT_EQ(outcome(report, "s1")->tool_count, 0u);
    EXPECT_TRUE(store.list_tools().empty());
}

TEST_F(MountTest, InactiveServersAreNotMounted) {
    auto s = make_server("s1", "off");
    s.active = false;
    store.add_server(s);
    EXPECT_TRUE(containers.mount_built_servers(manager).outcomes.empty());
}
