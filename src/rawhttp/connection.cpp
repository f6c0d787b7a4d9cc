#include <rawhttp/connection.hpp>
#include <rawhttp/request.hpp>
#include <rawhttp/response.hpp>
#include <sys/socket.h>
#include <unistd.h>         // close()
#include <iostream>
#include <stdexcept>

rawhttp::HTTP_STATUS_CODE rawhttp::dispatch(const Router &router, const compression::Compressors &compressors,
                                            const std::string &raw, ByteSink &sink, const std::string &client) {
    std::string method = raw.substr(0, raw.find(' '));
    if(!router.has_method(method)) {
        sink.write(BARE_NOT_FOUND);
        std::string raw_path;
        size_t path_start = raw.find(' ');
        if(path_start != std::string::npos) {
            raw_path = raw.substr(path_start + 1, raw.find_first_of(" \r\n", path_start + 1) - path_start - 1);
        }
        std::cout << client << " - " << method << " " << raw_path << " - 404" << std::endl;
        return HTTP_STATUS_CODE::NOT_FOUND;
    }

    HTTP_Request request = parse_request(raw, router);
    const Handler *handler = router.find(request.method, request.path);
    if(!handler) {
        sink.write(BARE_NOT_FOUND);
        std::cout << client << " - " << request.method << " " << request.raw_path << " - 404" << std::endl;
        return HTTP_STATUS_CODE::NOT_FOUND;
    }

    HTTP_Response response(sink, compression::select_compressor(request, compressors));
    try {
        (*handler)(request, response);
    } catch (const std::exception& e) {
        std::cerr << "Error in handler for " << request.method << " " << request.path << ": " << e.what() << std::endl;
        if(response.sent()) {
            throw;
        }
        sink.write(BARE_NOT_FOUND);
        return HTTP_STATUS_CODE::NOT_FOUND;
    }

    if(!response.sent()) {
        std::cerr << "Warning: handler for " << request.method << " " << request.path
                  << " returned without sending a response" << std::endl;
    }

    std::cout << client << " - " << request.method << " " << request.raw_path
              << " - " << static_cast<int>(response.status_code()) << std::endl;
    return response.status_code();
}

rawhttp::Connection::Connection(int fd, std::string client_ip, const Router &router, const compression::Compressors &compressors)
    : client_fd(fd), ip(std::move(client_ip)), router(router), compressors(compressors), sink(fd),
      last_active(std::chrono::steady_clock::now()) {
    std::cout << "New client connection from " << ip << std::endl;
}

rawhttp::Connection::~Connection() {
    on_close();
}

void rawhttp::Connection::on_data(const char *data, size_t len) {
    if(current_state == State::CLOSED) {
        throw std::logic_error("Data received on a closed connection");
    }

    last_active = std::chrono::steady_clock::now();
    pending.append(data, len);
    while(auto raw = pending.next()) {
        current_state = State::DISPATCHING;
        try {
            dispatch(router, compressors, *raw, sink, ip);
        } catch (...) {
            current_state = State::IDLE;
            throw;
        }
        current_state = State::IDLE;
    }
}

void rawhttp::Connection::on_close() {
    if(current_state == State::CLOSED) {
        return;
    }
    if(!pending.empty()) {
        std::cerr << "Discarding " << pending.size() << " bytes of incomplete request from " << ip << std::endl;
    }
    shutdown(client_fd, SHUT_RDWR);
    close(client_fd);
    current_state = State::CLOSED;
    std::cout << "Closed connection from " << ip << std::endl;
}
