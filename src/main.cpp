#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include "commands.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: mcpharbor [--config PATH] <command> [options]\n\n"
              << "Commands:\n"
              << "  serve [--host H] [--port P]  Mount built servers and start the MCP gateway\n"
              << "  mount                        Run one reconciliation pass and print the report\n"
              << "  build <server-id>            Build the container image for a server\n"
              << "  status                       Show configuration, docker and server health\n"
              << "  logs <server-id> [--tail N]  Print the tail of a server container's logs\n"
              << "  restart <server-id>          Restart a server container\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = mcpharbor::default_config_path();
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            args.push_back(a);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    std::string cmd = args[0];
    args.erase(args.begin());

    try {
        if (cmd == "serve") {
            std::string host;
            int port = 0;
            for (size_t i = 0; i < args.size(); i++) {
                if (args[i] == "--host" && i + 1 < args.size()) {
                    host = args[++i];
                } else if (args[i] == "--port" && i + 1 < args.size()) {
                    port = std::stoi(args[++i]);
                }
            }
            return mcpharbor::cmd_serve(config_path, host, port);
        }
        else if (cmd == "mount") {
            return mcpharbor::cmd_mount(config_path);
        }
        else if (cmd == "status") {
            return mcpharbor::cmd_status(config_path);
        }
        else if (cmd == "build" || cmd == "logs" || cmd == "restart") {
            if (args.empty()) {
                std::cerr << cmd << " requires a server id\n";
                print_usage();
                return 1;
            }
            std::string id = args[0];
            if (cmd == "build") return mcpharbor::cmd_build(config_path, id);
            if (cmd == "restart") return mcpharbor::cmd_restart(config_path, id);

            int tail = -1;
            for (size_t i = 1; i < args.size(); i++) {
                if (args[i] == "--tail" && i + 1 < args.size()) tail = std::stoi(args[++i]);
            }
            return mcpharbor::cmd_logs(config_path, id, tail);
        }
        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return 1;
    }
}
