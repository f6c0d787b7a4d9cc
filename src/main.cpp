#include <rawhttp/server.hpp>
#include <rawhttp/routes.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace {
    rawhttp::HTTP_Server *active_server = nullptr;

    void handle_signal(int) {
        if(active_server) {
            active_server->stop();
        }
    }
}

int main(int argc, char **argv) {
    try {
        // The served directory is the --directory value or the last positional argument
        std::string root_path = rawhttp::config::DEFAULT_ROOT_PATH;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--directory" || arg == "-d") {
                if (i + 1 < argc) {
                    root_path = argv[++i];
                } else {
                    throw std::invalid_argument("--directory option requires a path argument");
                }
            } else if (!arg.empty() && arg[0] == '-') {
                throw std::invalid_argument("Unknown option: " + arg);
            } else {
                root_path = arg;
            }
        }

        if (!std::filesystem::exists(root_path)) {
            throw std::runtime_error("Root directory does not exist: " + root_path);
        }
        if (!std::filesystem::is_directory(root_path)) {
            throw std::runtime_error("Specified path is not a directory: " + root_path);
        }

        rawhttp::HTTP_Server server(rawhttp::config::DEFAULT_PORT, rawhttp::config::DEFAULT_HOST);
        rawhttp::register_routes(server.routes(), root_path);
        std::cout << "Serving files from " << root_path << std::endl;

        active_server = &server;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        server.run();
        active_server = nullptr;
    } catch(const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
