#include "router.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>

using namespace mcpharbor;

namespace {

// Minimal stdio MCP server: answers initialize, tools/list and tools/call.
// Requests arrive as compact JSON with keys in sorted order.
const char* kFakeServer = R"SH(
while IFS= read -r line; do
  id=$(printf '%s' "$line" | sed -n 's/.*"id":\([0-9]*\).*/\1/p')
  case "$line" in
    *'"method":"initialize"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"protocolVersion":"2025-06-18","capabilities":{"tools":{}}}}\n' "$id" ;;
    *'"method":"tools/list"'*)
      echo "starting up (not protocol)"
      printf '{"jsonrpc":"2.0","id":%s,"result":{"tools":[{"name":"echo","description":"Echo input","inputSchema":{"type":"object"}},{"name":"env","description":"Show token"}]}}\n' "$id" ;;
    *'"name":"env"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[{"type":"text","text":"%s"}]}}\n' "$id" "$HARBOR_TOKEN" ;;
    *'"method":"tools/call"'*)
      printf '{"jsonrpc":"2.0","id":%s,"error":{"code":-32000,"message":"echo exploded"}}\n' "$id" ;;
  esac
done
)SH";

// Answers initialize, then a tools/list whose entries have wrong field types
const char* kSloppyServer = R"SH(
while IFS= read -r line; do
  id=$(printf '%s' "$line" | sed -n 's/.*"id":\([0-9]*\).*/\1/p')
  case "$line" in
    *'"method":"initialize"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"protocolVersion":"2025-06-18","serverInfo":{"name":null}}}\n' "$id" ;;
    *'"method":"tools/list"'*)
      printf '{"jsonrpc":"2.0","id":%s,"result":{"tools":[{"name":"echo","description":null},{"name":42},{"name":"ok","inputSchema":"object"}]}}\n' "$id" ;;
  esac
done
)SH";

LaunchConfig shell_server() {
    LaunchConfig cfg;
    cfg.key = "new";
    cfg.command = "/bin/sh";
    cfg.args = {"-c", kFakeServer};
    cfg.env = {{"HARBOR_TOKEN", "tok-123"}};
    return cfg;
}

} // namespace

TEST(RouterTest, NamespacedNames) {
    EXPECT_EQ(namespaced_tool_name("abc", "read_file"), "abc_read_file");
}

TEST(RouterTest, MountExposesNamespacedTools) {
    McpRouter router(5);
    auto tools = router.mount("srv", shell_server());
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "srv_echo");
    EXPECT_EQ(tools[0].input_schema["type"], "object");
    EXPECT_EQ(tools[1].name, "srv_env");
    EXPECT_TRUE(tools[1].input_schema.contains("properties"));

    auto listed = router.list_tools();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].name().value_or(""), "srv_echo");
    EXPECT_EQ(router.mounted(), std::vector<std::string>{"srv"});
}

TEST(RouterTest, CallReachesUpstreamWithEnvironment) {
    McpRouter router(5);
    router.mount("srv", shell_server());
    auto result = router.call_tool("srv_env", nlohmann::json::object());
    EXPECT_EQ(result["content"][0]["text"], "tok-123");
}

TEST(RouterTest, LaunchEnvironmentOverridesInheritedValues) {
    setenv("HARBOR_TOKEN", "from-parent", 1);
    McpRouter router(5);
    router.mount("srv", shell_server());
    auto overridden = router.call_tool("srv_env", nlohmann::json::object());

    LaunchConfig plain = shell_server();
    plain.env.clear();
    router.mount("bare", plain);
    auto inherited = router.call_tool("bare_env", nlohmann::json::object());
    unsetenv("HARBOR_TOKEN");

    EXPECT_EQ(overridden["content"][0]["text"], "tok-123");
    EXPECT_EQ(inherited["content"][0]["text"], "from-parent");
}

TEST(RouterTest, UpstreamErrorsPropagate) {
    McpRouter router(5);
    router.mount("srv", shell_server());
    try {
        router.call_tool("srv_echo", {{"text", "hi"}});
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("echo exploded"), std::string::npos);
    }
}

TEST(RouterTest, UnknownToolIsOutOfRange) {
    McpRouter router(5);
    router.mount("srv", shell_server());
    EXPECT_THROW(router.call_tool("srv_missing", {}), std::out_of_range);
    EXPECT_THROW(router.call_tool("other_echo", {}), std::out_of_range);
}

TEST(RouterTest, MalformedToolEntriesAreSkippedNotFatal) {
    McpRouter router(5);
    LaunchConfig cfg;
    cfg.key = "new";
    cfg.command = "/bin/sh";
    cfg.args = {"-c", kSloppyServer};

    std::vector<ToolDescriptor> tools;
    ASSERT_NO_THROW(tools = router.mount("srv", cfg));
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "srv_echo");
    EXPECT_EQ(tools[0].description, "");
    EXPECT_EQ(tools[1].name, "srv_ok");
    EXPECT_TRUE(tools[1].input_schema.is_object());
    EXPECT_TRUE(tools[1].input_schema.contains("properties"));
}

TEST(RouterTest, FailedLaunchThrows) {
    McpRouter router(2);
    LaunchConfig cfg;
    cfg.key = "new";
    cfg.command = "/nonexistent/mcp-server";
    EXPECT_THROW(router.mount("broken", cfg), std::runtime_error);
    EXPECT_TRUE(router.mounted().empty());
}

TEST(RouterTest, UnmountRemovesTools) {
    McpRouter router(5);
    router.mount("a", shell_server());
    router.mount("b", shell_server());
    EXPECT_EQ(router.list_tools().size(), 4u);

    EXPECT_TRUE(router.unmount("a"));
    EXPECT_FALSE(router.unmount("a"));
    EXPECT_EQ(router.list_tools().size(), 2u);

    router.unmount_all();
    EXPECT_TRUE(router.mounted().empty());
}
