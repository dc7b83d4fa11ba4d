#include "container_manager.hpp"
#include "fakes.hpp"
#include "mcp_config.hpp"
#include "secret_files.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace mcpharbor;
using namespace mcpharbor::testing;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

bool contains_pair(const std::vector<std::string>& v, const std::string& a, const std::string& b) {
    for (size_t i = 0; i + 1 < v.size(); i++) {
        if (v[i] == a && v[i + 1] == b) return true;
    }
    return false;
}

} // namespace

class LaunchConfigTest : public ::testing::Test {
protected:
    TempDir dir;
    Config cfg = test_config(dir);
    Store store{dir.file("harbor.db")};
    FakeRuntime runtime;
    ContainerManager containers{runtime, store, cfg};
};

TEST_F(LaunchConfigTest, HealthyContainerIsAttached) {
    auto s = make_server("s1", "fetch");
    s.env_variables = {{"API_KEY", "sk-123", true}};
    runtime.add_container("mcp-s1", "running", "test-ns/server-s1");

    auto launch = build_config(containers, s);
    EXPECT_EQ(launch.key, "existing");
    EXPECT_TRUE(launch.attaches());
    EXPECT_EQ(launch.command, "docker");

    std::vector<std::string> expected = {"exec", "-i", "-e", "API_KEY", "mcp-s1", "npx", "-y", "@example/fetch"};
    EXPECT_EQ(launch.args, expected);
    EXPECT_EQ(launch.env.at("API_KEY"), "sk-123");
}

TEST_F(LaunchConfigTest, MissingContainerStartsNewOne) {
    auto s = make_server("s1", "fetch");
    auto launch = build_config(containers, s);

    EXPECT_EQ(launch.key, "new");
    EXPECT_FALSE(launch.attaches());
    ASSERT_GE(launch.args.size(), 4u);
    EXPECT_EQ(launch.args[0], "run");
    EXPECT_EQ(launch.args[1], "-i");
    EXPECT_TRUE(contains_pair(launch.args, "--name", "mcp-s1"));
    EXPECT_TRUE(contains_pair(launch.args, "--memory", "512m"));
    EXPECT_TRUE(contains_pair(launch.args, "--label", "mcpharbor.server=s1"));
    EXPECT_FALSE(contains(launch.args, "--network"));

    // Image precedes the start argv
    auto image = std::find(launch.args.begin(), launch.args.end(), "test-ns/server-s1");
    ASSERT_NE(image, launch.args.end());
    std::vector<std::string> tail(image + 1, launch.args.end());
    std::vector<std::string> start = {"npx", "-y", "@example/fetch"};
    EXPECT_EQ(tail, start);
}

TEST_F(LaunchConfigTest, StaleContainerStartsNewOne) {
    auto s = make_server("s1", "fetch");
    runtime.add_container("mcp-s1", "running", "test-ns/server-old");
    EXPECT_EQ(build_config(containers, s).key, "new");
}

TEST_F(LaunchConfigTest, SecretValuesNeverAppearInArgs) {
    auto s = make_server("s1", "fetch");
    s.env_variables = {{"TOKEN", "very-secret-value", true}};
    auto launch = build_config(containers, s);

    EXPECT_TRUE(contains_pair(launch.args, "-e", "TOKEN"));
    for (auto& a : launch.args) EXPECT_EQ(a.find("very-secret-value"), std::string::npos) << a;
    EXPECT_EQ(launch.env.at("TOKEN"), "very-secret-value");
}

TEST_F(LaunchConfigTest, SecretFilesAreMountedReadOnly) {
    auto s = make_server("s1", "fetch");
    SecretFileManager files(cfg.secrets_path());
    std::string stored = files.store_file("s1", "creds.json", "{\"k\":1}");

    SecretFile f;
    f.server_id = "s1";
    f.original_filename = "creds.json";
    f.stored_filename = stored;
    f.env_var_name = "GOOGLE_APPLICATION_CREDENTIALS";
    s.secret_files = {f};

    auto launch = build_config(containers, s);
    std::string host = files.file_path("s1", stored);
    EXPECT_TRUE(contains_pair(launch.args, "-v", host + ":/run/secrets/GOOGLE_APPLICATION_CREDENTIALS:ro"));
    EXPECT_EQ(launch.env.at("GOOGLE_APPLICATION_CREDENTIALS"), "/run/secrets/GOOGLE_APPLICATION_CREDENTIALS");
}

TEST_F(LaunchConfigTest, NetworkIsPassedWhenConfigured) {
    cfg.docker.network = "mcp-net";
    cfg.docker.memory_limit = "";
    ContainerManager scoped(runtime, store, cfg);

    auto launch = build_config(scoped, make_server("s1", "fetch"));
    EXPECT_TRUE(contains_pair(launch.args, "--network", "mcp-net"));
    EXPECT_FALSE(contains(launch.args, "--memory"));
}

TEST_F(LaunchConfigTest, JsonIsKeyedByBranch) {
    auto launch = build_config(containers, make_server("s1", "fetch"));
    auto j = launch.to_json();
    ASSERT_TRUE(j.contains("new"));
    EXPECT_EQ(j["new"]["command"], "docker");
    EXPECT_TRUE(j["new"]["args"].is_array());
    EXPECT_TRUE(j["new"]["env"].is_object());
}
