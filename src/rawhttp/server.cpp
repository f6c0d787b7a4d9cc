#include <rawhttp/server.hpp>
#include <sys/socket.h>
#include <sys/time.h>       // timeval
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>         // close()
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <vector>

rawhttp::HTTP_Server::HTTP_Server(uint16_t port, const std::string &host)
    : compressors(compression::default_compressors()) {
    try {
        // Create socket
        server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if(server_fd < 0) {
            throw std::runtime_error("Failed to create socket");
        }

        // Set socket options to reuse address
        int opt = 1;
        if(setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            throw std::runtime_error("Failed to set socket options");
        }

        // Setup server address
        std::memset(&this->server_address, 0, sizeof(this->server_address));
        server_address.sin_family = AF_INET;
        server_address.sin_port = htons(port);
        if(inet_pton(AF_INET, host.c_str(), &server_address.sin_addr) != 1) {
            throw std::invalid_argument("Invalid listen address: " + host);
        }

        // Bind socket
        if(bind(server_fd, (struct sockaddr *)&server_address, sizeof(server_address)) < 0) {
            throw std::runtime_error("Failed to bind to " + host + ":" + std::to_string(port) + ": " + strerror(errno));
        }

        // Listen for connections
        if(listen(server_fd, config::BACKLOG_SIZE) < 0) {
            throw std::runtime_error("Failed to listen on port " + std::to_string(port));
        }

        socklen_t address_len = sizeof(server_address);
        if(getsockname(server_fd, (struct sockaddr *)&server_address, &address_len) < 0) {
            throw std::runtime_error("Failed to read bound address");
        }
        bound_port = ntohs(server_address.sin_port);

        std::cout << "Server listening on " << host << ":" << bound_port << std::endl;
    } catch (const std::exception& e) {
        // Close socket if it was opened
        if(server_fd >= 0) {
            close(server_fd);
            server_fd = -1;
        }
        std::cerr << "Server initialization error: " << e.what() << std::endl;
        throw;  // Re-throw to be handled by main()
    }
}

void rawhttp::HTTP_Server::add_route(const std::string &method, const std::string &path_pattern, Handler handler) {
    if(started) {
        throw std::logic_error("Cannot add route " + method + " " + path_pattern + " while serving");
    }
    router.add_route(method, path_pattern, std::move(handler));
}

rawhttp::Router &rawhttp::HTTP_Server::routes() {
    if(started) {
        throw std::logic_error("Route table is read-only while serving");
    }
    return router;
}

void rawhttp::HTTP_Server::run() {
    started = true;
    running = true;
    std::cout << "Server starting to listen for connections..." << std::endl;

    std::vector<pollfd> fds;
    while(running) {
        fds.clear();
        fds.push_back({server_fd, POLLIN, 0});
        for(const auto &[fd, connection] : connections) {
            fds.push_back({fd, POLLIN, 0});
        }

        int ready = poll(fds.data(), fds.size(), config::POLL_TIMEOUT_MS);
        if(ready < 0) {
            if(errno == EINTR) {
                continue;
            }
            throw std::runtime_error("poll failed: " + std::string(strerror(errno)));
        }
        if(ready > 0 && (fds[0].revents & POLLIN)) {
            accept_client();
        }

        // Events are handled in fd order, one read per connection per round
        for(size_t i = 1; ready > 0 && i < fds.size(); ++i) {
            if(fds[i].revents == 0) {
                continue;
            }
            auto it = connections.find(fds[i].fd);
            if(it == connections.end()) {
                continue;
            }
            if(fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                read_client(*it->second);
            }
            if(it->second->state() == Connection::State::CLOSED) {
                connections.erase(it);
            }
        }

        close_idle_connections();
    }

    connections.clear();
    started = false;
    std::cout << "Server stopped" << std::endl;
}

void rawhttp::HTTP_Server::set_connection_timeout(std::chrono::seconds timeout) {
    if(started) {
        throw std::logic_error("Cannot change the connection timeout while serving");
    }
    connection_timeout = timeout;
}

void rawhttp::HTTP_Server::close_idle_connections() {
    auto now = std::chrono::steady_clock::now();
    for(auto it = connections.begin(); it != connections.end();) {
        if(it->second->idle_for(connection_timeout, now)) {
            std::cout << "Closing idle connection from " << it->second->client_ip() << std::endl;
            it = connections.erase(it);
        } else {
            ++it;
        }
    }
}

void rawhttp::HTTP_Server::accept_client() {
    struct sockaddr_in client_address;
    socklen_t client_address_len = sizeof(client_address);

    int client_fd = accept(this->server_fd, (struct sockaddr *)&client_address, &client_address_len);
    if(client_fd < 0) {
        std::cerr << "Error accepting connection: " << strerror(errno) << std::endl;
        return;
    }

    struct timeval timeout{static_cast<time_t>(connection_timeout.count()), 0};
    if(setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0 ||
       setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::cerr << "Failed to set socket timeouts: " << strerror(errno) << std::endl;
    }

    char client_ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN);
    connections[client_fd] = std::make_unique<Connection>(client_fd, client_ip, router, compressors);
}

void rawhttp::HTTP_Server::read_client(Connection &connection) {
    char buffer[config::BUF_LEN];
    ssize_t bytes_read = recv(connection.fd(), buffer, sizeof(buffer), 0);
    if(bytes_read <= 0) {
        if(bytes_read < 0 && errno == EINTR) {
            return;
        }
        // Client disconnected or error
        if(bytes_read < 0) {
            std::cerr << "Error reading from " << connection.client_ip() << ": " << strerror(errno) << std::endl;
        }
        connection.on_close();
        return;
    }

    try {
        connection.on_data(buffer, static_cast<size_t>(bytes_read));
    } catch (const std::exception& e) {
        std::cerr << "Error processing request from " << connection.client_ip() << ": " << e.what() << std::endl;
        connection.on_close();
    }
}

rawhttp::HTTP_Server::~HTTP_Server() {
    connections.clear();
    if(server_fd >= 0) {
        close(server_fd);
        server_fd = -1;
    }
}
