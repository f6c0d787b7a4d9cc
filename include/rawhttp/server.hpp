#ifndef RAWHTTP_SERVER_HPP
#define RAWHTTP_SERVER_HPP

#include <rawhttp/config.hpp>                   // config::DEFAULT_PORT
#include <rawhttp/router.hpp>                   // Router, Handler
#include <rawhttp/connection.hpp>               // Connection
#include <rawhttp/compression/negotiation.hpp>  // Compressors
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <arpa/inet.h>      // sockaddr_in

namespace rawhttp {
    class HTTP_Server {
    public:
        // Binds and listens immediately; port 0 picks an ephemeral port.
        explicit HTTP_Server(uint16_t port = config::DEFAULT_PORT, const std::string &host = config::DEFAULT_HOST);
        ~HTTP_Server();
        HTTP_Server(const HTTP_Server &) = delete;
        HTTP_Server &operator=(const HTTP_Server &) = delete;

        // Routes are fixed once run() starts.
        void add_route(const std::string &method, const std::string &path_pattern, Handler handler);
        Router &routes();

        // Single-threaded event loop; returns after stop().
        void run();
        void stop() { running = false; }

        // Connections silent for longer than this are closed. Fixed once run() starts.
        void set_connection_timeout(std::chrono::seconds timeout);

        uint16_t port() const { return bound_port; }
    private:
        int server_fd = -1;
        uint16_t bound_port = 0;
        struct sockaddr_in server_address;
        Router router;
        compression::Compressors compressors;
        std::map<int, std::unique_ptr<Connection>> connections;
        std::atomic<bool> running{false};
        std::atomic<bool> started{false};
        std::chrono::seconds connection_timeout{config::CONNECTION_TIMEOUT};

        void accept_client();
        void read_client(Connection &connection);
        void close_idle_connections();
    };
}
#endif
