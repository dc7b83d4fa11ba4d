#pragma once
#include <string>

namespace mcpharbor {

int cmd_serve(const std::string& config_path, const std::string& host, int port);
int cmd_mount(const std::string& config_path);
int cmd_build(const std::string& config_path, const std::string& server_id);
int cmd_status(const std::string& config_path);
int cmd_logs(const std::string& config_path, const std::string& server_id, int tail);
int cmd_restart(const std::string& config_path, const std::string& server_id);

} // namespace mcpharbor
