#ifndef RAWHTTP_CONNECTION_HPP
#define RAWHTTP_CONNECTION_HPP

#include <rawhttp/router.hpp>                   // Router
#include <rawhttp/request_buffer.hpp>           // RequestBuffer
#include <rawhttp/sink.hpp>                     // ByteSink, SocketSink
#include <rawhttp/status.hpp>                   // HTTP_STATUS_CODE
#include <rawhttp/compression/negotiation.hpp>  // Compressors
#include <chrono>
#include <string>

namespace rawhttp {
    // Answers one complete request message on `sink` and returns the status written.
    HTTP_STATUS_CODE dispatch(const Router &router, const compression::Compressors &compressors,
                              const std::string &raw, ByteSink &sink, const std::string &client = "-");

    class Connection {
    public:
        enum class State { IDLE, DISPATCHING, CLOSED };

        // Takes ownership of the connected socket `fd`.
        Connection(int fd, std::string client_ip, const Router &router, const compression::Compressors &compressors);
        ~Connection();
        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        // Feeds one read. Every request completed by it is answered before returning.
        // Throws std::runtime_error if a response could not be written.
        void on_data(const char *data, size_t len);
        void on_close();

        State state() const { return current_state; }
        int fd() const { return client_fd; }
        const std::string &client_ip() const { return ip; }

        // True once nothing has been received for `limit`.
        bool idle_for(std::chrono::steady_clock::duration limit,
                      std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const {
            return now - last_active >= limit;
        }
    private:
        int client_fd;
        std::string ip;
        const Router &router;
        const compression::Compressors &compressors;
        SocketSink sink;
        RequestBuffer pending;
        State current_state = State::IDLE;
        std::chrono::steady_clock::time_point last_active;
    };
}

#endif
