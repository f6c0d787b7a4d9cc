#ifndef RAWHTTP_REQUEST_BUFFER_HPP
#define RAWHTTP_REQUEST_BUFFER_HPP

#include <rawhttp/config.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace rawhttp {
    // Reassembles request messages from a stream of reads. A message is
    // complete once the header block and Content-Length body bytes are in.
    class RequestBuffer {
    public:
        explicit RequestBuffer(std::size_t max_size = config::MAX_REQUEST_SIZE);

        void append(const char *data, std::size_t len);
        void append(const std::string &data) { append(data.data(), data.size()); }

        std::optional<std::string> next();

        std::size_t size() const { return buffer.size(); }
        bool empty() const { return buffer.empty(); }
    private:
        std::size_t max_size;
        std::string buffer;

        static std::size_t content_length(const std::string &header_block);
    };
}

#endif
