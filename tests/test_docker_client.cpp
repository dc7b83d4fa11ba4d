#include "docker_client.hpp"
#include <gtest/gtest.h>

using namespace mcpharbor;

namespace {

std::string frame(char stream, const std::string& payload) {
    std::string out = {stream, 0, 0, 0};
    uint32_t n = static_cast<uint32_t>(payload.size());
    out += static_cast<char>((n >> 24) & 0xff);
    out += static_cast<char>((n >> 16) & 0xff);
    out += static_cast<char>((n >> 8) & 0xff);
    out += static_cast<char>(n & 0xff);
    return out + payload;
}

} // namespace

TEST(DockerStream, StripsFrameHeaders) {
    std::string raw = frame(1, "listening on stdio\n") + frame(2, "Error: token missing\n");
    EXPECT_EQ(demux_docker_stream(raw), "listening on stdio\nError: token missing\n");
}

TEST(DockerStream, PlainOutputIsUnchanged) {
    EXPECT_EQ(demux_docker_stream("plain tty output\n"), "plain tty output\n");
    EXPECT_EQ(demux_docker_stream(""), "");
}

TEST(DockerStream, TruncatedFrameReturnsInput) {
    std::string raw = frame(1, "hello");
    raw.pop_back();
    EXPECT_EQ(demux_docker_stream(raw), raw);
}

TEST(MemoryLimit, ParsesUnits) {
    EXPECT_EQ(parse_memory_limit("512m"), 512LL * 1024 * 1024);
    EXPECT_EQ(parse_memory_limit("1g"), 1024LL * 1024 * 1024);
    EXPECT_EQ(parse_memory_limit("1GB"), 1024LL * 1024 * 1024);
    EXPECT_EQ(parse_memory_limit("64k"), 64LL * 1024);
    EXPECT_EQ(parse_memory_limit("1048576"), 1048576);
}

TEST(MemoryLimit, RejectsGarbage) {
    EXPECT_EQ(parse_memory_limit(""), 0);
    EXPECT_EQ(parse_memory_limit("lots"), 0);
    EXPECT_EQ(parse_memory_limit("5x"), 0);
    EXPECT_EQ(parse_memory_limit("-1g"), 0);
}

TEST(ContainerInfoTest, MatchesTagWithImplicitLatest) {
    ContainerInfo info;
    info.status = "running";
    info.image_tags = {"mcp-harbor/server-abc:latest", "other:1.0"};
    EXPECT_TRUE(info.running());
    EXPECT_TRUE(info.has_image_tag("mcp-harbor/server-abc"));
    EXPECT_TRUE(info.has_image_tag("other:1.0"));
    EXPECT_FALSE(info.has_image_tag("mcp-harbor/server-abcd"));

    info.image_tags.clear();
    EXPECT_FALSE(info.has_image_tag("mcp-harbor/server-abc"));
}

TEST(DockerClientTest, UnreachableDaemonPingsFalse) {
    DockerClient client("unix:///nonexistent/docker.sock", 1);
    EXPECT_FALSE(client.ping());
}
