#include <rawhttp/sink.hpp>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

void rawhttp::SocketSink::write(const std::string &data) {
    size_t sent = 0;
    while(sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if(n < 0) {
            if(errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Error sending response: " + std::string(strerror(errno)));
        }
        sent += static_cast<size_t>(n);
    }
}
