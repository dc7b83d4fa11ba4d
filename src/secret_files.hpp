#pragma once
#include "models.hpp"
#include <string>
#include <vector>
#include <map>

namespace mcpharbor {

struct SecretMount {
    std::string host_path;
    std::string container_path;
    std::string env_var_name;

    // `-v` argument for docker run
    std::string volume_arg() const { return host_path + ":" + container_path + ":ro"; }
};

// Stages per-server secret files under <root>/<server_id>/ with owner-only
// permissions (directories 0700, files 0600).
class SecretFileManager {
public:
    explicit SecretFileManager(std::string root);

    // Writes the bytes and returns the generated stored filename.
    std::string store_file(const std::string& server_id,
                           const std::string& original_filename,
                           const std::string& content);

    std::string file_path(const std::string& server_id, const std::string& stored_filename) const;
    bool delete_file(const std::string& server_id, const std::string& stored_filename);
    void delete_server_files(const std::string& server_id);

    static std::string container_path(const std::string& env_var_name);

    // Read-only mounts for every active secret file present on disk
    std::vector<SecretMount> mounts_for(const Server& server) const;

    const std::string& root() const { return root_; }

private:
    std::string root_;

    std::string server_dir(const std::string& server_id) const;
};

} // namespace mcpharbor
