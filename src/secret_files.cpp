#include "secret_files.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <cctype>

namespace mcpharbor {

namespace {

// Stored names must stay inside the server directory
bool safe_component(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

std::string extension_of(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot == 0) return "";
    std::string ext = filename.substr(dot);
    for (char c : ext) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.') return "";
    }
    return ext.size() <= 10 ? ext : "";
}

} // namespace

SecretFileManager::SecretFileManager(std::string root) : root_(std::move(root)) {}

std::string SecretFileManager::server_dir(const std::string& server_id) const {
    if (!safe_component(server_id)) {
        throw std::invalid_argument("invalid server id for secret storage: " + server_id);
    }
    return root_ + "/" + server_id;
}

std::string SecretFileManager::store_file(const std::string& server_id,
                                          const std::string& original_filename,
                                          const std::string& content) {
    std::string dir = server_dir(server_id);
    fs::create_directories(dir);
    fs::permissions(root_, fs::perms::owner_all, fs::perm_options::replace);
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);

    std::string stored = generate_id(16) + extension_of(original_filename);
    std::string path = dir + "/" + stored;

    {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("Failed to create secret file " + path);
        // Restrict before any content lands on disk
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
        f.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!f) throw std::runtime_error("Failed to write secret file " + path);
    }

    std::cerr << "[secrets] Stored " << original_filename << " for server " << server_id
              << " (" << content.size() << " bytes)\n";
    return stored;
}

std::string SecretFileManager::file_path(const std::string& server_id,
                                         const std::string& stored_filename) const {
    if (!safe_component(stored_filename)) {
        throw std::invalid_argument("invalid stored filename: " + stored_filename);
    }
    return server_dir(server_id) + "/" + stored_filename;
}

bool SecretFileManager::delete_file(const std::string& server_id, const std::string& stored_filename) {
    std::error_code ec;
    bool removed = fs::remove(file_path(server_id, stored_filename), ec);
    if (ec) {
        std::cerr << "[secrets] Failed to delete " << stored_filename << ": " << ec.message() << "\n";
        return false;
    }
    return removed;
}

void SecretFileManager::delete_server_files(const std::string& server_id) {
    std::error_code ec;
    fs::remove_all(server_dir(server_id), ec);
    if (ec) {
        std::cerr << "[secrets] Failed to delete files for server " << server_id
                  << ": " << ec.message() << "\n";
    }
}

std::string SecretFileManager::container_path(const std::string& env_var_name) {
    return "/run/secrets/" + env_var_name;
}

std::vector<SecretMount> SecretFileManager::mounts_for(const Server& server) const {
    std::vector<SecretMount> mounts;
    for (auto& f : server.secret_files) {
        if (!f.active || f.env_var_name.empty()) continue;

        std::string host;
        try {
            host = file_path(server.id, f.stored_filename);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[secrets] Skipping secret " << f.original_filename << ": " << e.what() << "\n";
            continue;
        }

        std::error_code ec;
        if (!fs::exists(host, ec)) {
            std::cerr << "[secrets] Secret file missing for server " << server.id
                      << ": " << f.original_filename << "\n";
            continue;
        }
        mounts.push_back(SecretMount{host, container_path(f.env_var_name), f.env_var_name});
    }
    return mounts;
}

} // namespace mcpharbor
