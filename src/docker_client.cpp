#include "docker_client.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <array>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <sstream>

namespace mcpharbor {

namespace {

// ── Connection ──

struct Endpoint {
    std::string address;   // socket path or scheme://host:port
    bool unix_socket = false;
};

Endpoint parse_host(const std::string& host) {
    if (host.rfind("unix://", 0) == 0) return {host.substr(7), true};
    if (host.rfind("tcp://", 0) == 0) return {"http://" + host.substr(6), false};
    if (host.rfind("http://", 0) == 0) return {host, false};
    if (!host.empty() && host[0] == '/') return {host, true};
    throw DockerConnectionError("Unsupported docker host: " + host);
}

httplib::Client open_client(const std::string& host, int connect_timeout, int read_timeout) {
    auto ep = parse_host(host);
    httplib::Client cli(ep.address);
    if (ep.unix_socket) cli.set_address_family(AF_UNIX);
    cli.set_connection_timeout(connect_timeout);
    cli.set_read_timeout(read_timeout);
    cli.set_write_timeout(read_timeout);
    return cli;
}

std::string encode_query(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

// Docker error bodies look like {"message": "..."}
std::string error_message(const httplib::Response& res) {
    try {
        auto j = nlohmann::json::parse(res.body);
        if (j.contains("message") && j["message"].is_string()) return j["message"].get<std::string>();
    } catch (const nlohmann::json::exception&) {
    }
    return res.body;
}

void expect(const httplib::Result& res, const std::string& what) {
    if (!res) {
        throw DockerConnectionError(what + ": " + httplib::to_string(res.error()));
    }
    int status = res->status;
    if (status >= 200 && status < 300) return;
    if (status == 304) return;   // already in requested state
    if (status == 404) throw DockerNotFound(what + ": " + error_message(*res));
    throw DockerApiError(what + ": HTTP " + std::to_string(status) + ": " + error_message(*res), status);
}

// Streamed progress endpoints (pull, build) report failures in-band with a
// 200 status. Returns the concatenated "stream" text.
std::string scan_progress(const std::string& body, std::string& error_out) {
    std::string output;
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") continue;
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception&) {
            continue;
        }
        if (j.contains("error") && j["error"].is_string()) {
            error_out = j["error"].get<std::string>();
        } else if (j.contains("errorDetail") && j["errorDetail"].contains("message")) {
            error_out = j["errorDetail"]["message"].get<std::string>();
        }
        if (j.contains("stream") && j["stream"].is_string()) {
            output += j["stream"].get<std::string>();
        }
    }
    return output;
}

// ── Tar build context ──

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};

static_assert(sizeof(TarHeader) == 512, "tar header must be one block");

void write_octal(char* dest, size_t width, uint64_t value) {
    std::snprintf(dest, width, "%0*llo", static_cast<int>(width - 1),
                  static_cast<unsigned long long>(value));
}

void append_tar_file(std::string& tar, const std::string& name, const std::string& content) {
    TarHeader header{};
    std::memcpy(header.name, name.data(), std::min(name.size(), sizeof(header.name)));
    write_octal(header.mode, sizeof(header.mode), 0644);
    write_octal(header.uid, sizeof(header.uid), 0);
    write_octal(header.gid, sizeof(header.gid), 0);
    write_octal(header.size, sizeof(header.size), content.size());
    write_octal(header.mtime, sizeof(header.mtime), static_cast<uint64_t>(epoch_now()));
    std::fill(std::begin(header.checksum), std::end(header.checksum), ' ');
    header.typeflag = '0';
    std::memcpy(header.magic, "ustar", 5);
    std::memcpy(header.version, "00", 2);

    auto raw = reinterpret_cast<const unsigned char*>(&header);
    unsigned int sum = 0;
    for (size_t i = 0; i < sizeof(TarHeader); i++) sum += raw[i];
    std::snprintf(header.checksum, sizeof(header.checksum), "%06o", sum);
    header.checksum[6] = '\0';
    header.checksum[7] = ' ';

    tar.append(reinterpret_cast<const char*>(&header), sizeof(header));
    tar += content;
    size_t pad = (512 - content.size() % 512) % 512;
    tar.append(pad, '\0');
}

std::string dockerfile_context(const std::string& dockerfile) {
    std::string tar;
    append_tar_file(tar, "Dockerfile", dockerfile);
    tar.append(1024, '\0');   // two zero blocks end the archive
    return tar;
}

// "repo/name:tag" -> {"repo/name", "tag"}; a colon inside the registry host
// part is not a tag separator
std::pair<std::string, std::string> split_image_ref(const std::string& ref) {
    if (ref.find('@') != std::string::npos) return {ref, ""};
    auto colon = ref.rfind(':');
    auto slash = ref.rfind('/');
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return {ref, "latest"};
    }
    return {ref.substr(0, colon), ref.substr(colon + 1)};
}

} // namespace

// ── ContainerInfo ──

bool ContainerInfo::has_image_tag(const std::string& tag) const {
    for (auto& t : image_tags) {
        if (t == tag || t == tag + ":latest") return true;
    }
    return false;
}

// ── Stream helpers ──

std::string demux_docker_stream(const std::string& raw) {
    std::string out;
    size_t pos = 0;
    while (pos < raw.size()) {
        if (raw.size() - pos < 8) return raw;
        unsigned char stream = static_cast<unsigned char>(raw[pos]);
        if (stream > 2 || raw[pos + 1] != 0 || raw[pos + 2] != 0 || raw[pos + 3] != 0) return raw;
        size_t len = (static_cast<size_t>(static_cast<unsigned char>(raw[pos + 4])) << 24) |
                     (static_cast<size_t>(static_cast<unsigned char>(raw[pos + 5])) << 16) |
                     (static_cast<size_t>(static_cast<unsigned char>(raw[pos + 6])) << 8) |
                     static_cast<size_t>(static_cast<unsigned char>(raw[pos + 7]));
        pos += 8;
        if (len > raw.size() - pos) return raw;
        out.append(raw, pos, len);
        pos += len;
    }
    return out;
}

int64_t parse_memory_limit(const std::string& s) {
    if (s.empty()) return 0;
    size_t idx = 0;
    double value = 0;
    try {
        value = std::stod(s, &idx);
    } catch (const std::exception&) {
        return 0;
    }
    if (value <= 0) return 0;
    std::string unit = s.substr(idx);
    std::transform(unit.begin(), unit.end(), unit.begin(), ::tolower);
    if (!unit.empty() && unit.back() == 'b') unit.pop_back();

    double mult = 1;
    if (unit.empty()) mult = 1;
    else if (unit == "k") mult = 1024.0;
    else if (unit == "m") mult = 1024.0 * 1024;
    else if (unit == "g") mult = 1024.0 * 1024 * 1024;
    else return 0;
    return static_cast<int64_t>(value * mult);
}

// ── DockerClient ──

DockerClient::DockerClient(std::string host, int timeout_seconds)
    : host_(std::move(host)), timeout_(timeout_seconds) {}

bool DockerClient::ping() {
    try {
        auto cli = open_client(host_, 5, 5);
        auto res = cli.Get("/_ping");
        return res && res->status == 200;
    } catch (const DockerError& e) {
        std::cerr << "[docker] " << e.what() << "\n";
        return false;
    }
}

ContainerInfo DockerClient::get_container(const std::string& name) {
    auto cli = open_client(host_, 10, timeout_);
    auto res = cli.Get("/containers/" + encode_query(name) + "/json");
    expect(res, "inspect container " + name);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::exception& e) {
        throw DockerApiError("inspect container " + name + ": invalid response: " + e.what());
    }

    ContainerInfo info;
    info.id = j.value("Id", "");
    info.name = j.value("Name", "");
    if (!info.name.empty() && info.name[0] == '/') info.name.erase(0, 1);
    if (j.contains("State") && j["State"].is_object()) {
        info.status = j["State"].value("Status", "");
    }
    if (j.contains("Config") && j["Config"].is_object()) {
        info.image = j["Config"].value("Image", "");
    }

    // Tags live on the image, not the container
    std::string image_id = j.value("Image", "");
    if (!image_id.empty()) {
        auto img = cli.Get("/images/" + encode_query(image_id) + "/json");
        if (img && img->status == 200) {
            try {
                auto ij = nlohmann::json::parse(img->body);
                if (ij.contains("RepoTags") && ij["RepoTags"].is_array()) {
                    for (auto& t : ij["RepoTags"]) {
                        if (t.is_string()) info.image_tags.push_back(t.get<std::string>());
                    }
                }
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[docker] Unreadable image metadata for " << name << ": " << e.what() << "\n";
            }
        }
    }
    return info;
}

ContainerInfo DockerClient::create_and_start(const ContainerSpec& spec) {
    nlohmann::json body;
    body["Image"] = spec.image;
    if (!spec.cmd.empty()) body["Cmd"] = spec.cmd;
    nlohmann::json env = nlohmann::json::array();
    for (auto& [k, v] : spec.env) env.push_back(k + "=" + v);
    body["Env"] = env;
    body["OpenStdin"] = spec.open_stdin;
    body["StdinOnce"] = false;
    body["Tty"] = false;
    body["AttachStdin"] = spec.open_stdin;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    if (!spec.labels.empty()) body["Labels"] = spec.labels;

    nlohmann::json host_config = nlohmann::json::object();
    if (!spec.binds.empty()) host_config["Binds"] = spec.binds;
    int64_t memory = parse_memory_limit(spec.memory_limit);
    if (memory > 0) host_config["Memory"] = memory;
    if (!spec.network.empty()) host_config["NetworkMode"] = spec.network;
    body["HostConfig"] = host_config;

    auto cli = open_client(host_, 10, timeout_);
    auto created = cli.Post("/containers/create?name=" + encode_query(spec.name),
                            body.dump(), "application/json");
    expect(created, "create container " + spec.name);
    std::string id;
    try {
        id = nlohmann::json::parse(created->body).value("Id", "");
    } catch (const nlohmann::json::exception& e) {
        throw DockerApiError("create container " + spec.name + ": invalid response: " + e.what());
    }

    expect(cli.Post("/containers/" + id + "/start", "", "application/json"),
           "start container " + spec.name);
    std::cerr << "[docker] Started container " << spec.name << " (" << id.substr(0, 12) << ")\n";
    return get_container(id);
}

void DockerClient::stop(const std::string& id, int timeout_seconds) {
    // The daemon holds the request open for the whole grace period
    auto cli = open_client(host_, 10, timeout_ + timeout_seconds);
    expect(cli.Post("/containers/" + encode_query(id) + "/stop?t=" + std::to_string(timeout_seconds),
                    "", "application/json"),
           "stop container " + id);
}

void DockerClient::restart(const std::string& id) {
    auto cli = open_client(host_, 10, timeout_ + 10);
    expect(cli.Post("/containers/" + encode_query(id) + "/restart?t=10", "", "application/json"),
           "restart container " + id);
}

void DockerClient::remove(const std::string& id, bool force) {
    auto cli = open_client(host_, 10, timeout_);
    std::string path = "/containers/" + encode_query(id) + (force ? "?force=true" : "");
    expect(cli.Delete(path), "remove container " + id);
}

std::string DockerClient::logs(const std::string& id, int tail) {
    auto cli = open_client(host_, 10, timeout_);
    auto res = cli.Get("/containers/" + encode_query(id) +
                       "/logs?stdout=1&stderr=1&tail=" + std::to_string(tail));
    expect(res, "logs for container " + id);
    return demux_docker_stream(res->body);
}

void DockerClient::get_image(const std::string& ref) {
    auto cli = open_client(host_, 10, timeout_);
    auto res = cli.Get("/images/" + encode_query(ref) + "/json");
    if (res && res->status == 404) throw ImageNotFound("image not found: " + ref);
    expect(res, "inspect image " + ref);
}

void DockerClient::pull_image(const std::string& ref) {
    auto [name, tag] = split_image_ref(ref);
    std::string path = "/images/create?fromImage=" + encode_query(name);
    if (!tag.empty()) path += "&tag=" + encode_query(tag);

    std::cerr << "[docker] Pulling image " << ref << "\n";
    // Pulls of large base images can take several minutes
    auto cli = open_client(host_, 10, std::max(timeout_, 600));
    auto res = cli.Post(path, "", "application/json");
    if (!res) {
        throw DockerConnectionError("pull image " + ref + ": " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw ImagePullError("pull image " + ref + ": " + error_message(*res), res->status);
    }
    std::string error;
    scan_progress(res->body, error);
    if (!error.empty()) throw ImagePullError("pull image " + ref + ": " + error, res->status);
}

std::string DockerClient::build_image(const std::string& tag, const std::string& dockerfile) {
    std::string context = dockerfile_context(dockerfile);
    std::string path = "/build?t=" + encode_query(tag) + "&rm=1&forcerm=1";

    std::cerr << "[docker] Building image " << tag << "\n";
    auto cli = open_client(host_, 10, std::max(timeout_, 1800));
    auto res = cli.Post(path, context, "application/x-tar");
    if (!res) {
        throw DockerConnectionError("build image " + tag + ": " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw DockerApiError("build image " + tag + ": " + error_message(*res), res->status);
    }
    std::string error;
    std::string output = scan_progress(res->body, error);
    if (!error.empty()) throw DockerApiError("build image " + tag + ": " + error, res->status);
    return sanitize_utf8(output);
}

} // namespace mcpharbor
