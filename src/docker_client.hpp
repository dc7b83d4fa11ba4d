#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace mcpharbor {

struct ContainerInfo {
    std::string id;
    std::string name;
    std::string status;                    // created, running, exited, ...
    std::string image;                     // reference the container was created from
    std::vector<std::string> image_tags;   // tags of the bound image

    bool running() const { return status == "running"; }
    bool has_image_tag(const std::string& tag) const;
};

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> cmd;
    std::map<std::string, std::string> env;
    std::vector<std::string> binds;        // host:container[:ro]
    std::string memory_limit;              // "512m", "1g", empty = unlimited
    std::string network;
    std::map<std::string, std::string> labels;
    bool open_stdin = true;
};

// Primitives of the container engine. Every call may throw the DockerError
// family (see errors.hpp) except ping(), which reports failure as false.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual bool ping() = 0;
    // Throws DockerNotFound when no container has this name or id
    virtual ContainerInfo get_container(const std::string& name) = 0;
    virtual ContainerInfo create_and_start(const ContainerSpec& spec) = 0;
    virtual void stop(const std::string& id, int timeout_seconds) = 0;
    virtual void restart(const std::string& id) = 0;
    virtual void remove(const std::string& id, bool force) = 0;
    // Raw log bytes, stdout and stderr interleaved
    virtual std::string logs(const std::string& id, int tail) = 0;
    // Throws ImageNotFound when the image is not present locally
    virtual void get_image(const std::string& ref) = 0;
    // Throws ImagePullError when the registry is unreachable or has no such image
    virtual void pull_image(const std::string& ref) = 0;
    // Builds an image from a single Dockerfile; returns the build output
    virtual std::string build_image(const std::string& tag, const std::string& dockerfile) = 0;
};

// Docker Engine API client over the daemon socket (unix://) or TCP (tcp://).
// Each call opens its own connection, so one instance is shared freely
// across threads.
class DockerClient : public ContainerRuntime {
public:
    DockerClient(std::string host, int timeout_seconds);

    bool ping() override;
    ContainerInfo get_container(const std::string& name) override;
    ContainerInfo create_and_start(const ContainerSpec& spec) override;
    void stop(const std::string& id, int timeout_seconds) override;
    void restart(const std::string& id) override;
    void remove(const std::string& id, bool force) override;
    std::string logs(const std::string& id, int tail) override;
    void get_image(const std::string& ref) override;
    void pull_image(const std::string& ref) override;
    std::string build_image(const std::string& tag, const std::string& dockerfile) override;

    const std::string& host() const { return host_; }

private:
    std::string host_;
    int timeout_;
};

// Strips the 8-byte frame headers Docker puts on non-TTY log streams.
// Input without valid frame headers is returned unchanged.
std::string demux_docker_stream(const std::string& raw);

// "512m" -> 536870912; 0 for empty or unparsable values
int64_t parse_memory_limit(const std::string& s);

} // namespace mcpharbor
