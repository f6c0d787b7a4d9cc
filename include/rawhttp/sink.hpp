#ifndef RAWHTTP_SINK_HPP
#define RAWHTTP_SINK_HPP

#include <string>

namespace rawhttp {
    // Destination for serialized response bytes.
    class ByteSink {
    public:
        virtual ~ByteSink() = default;
        virtual void write(const std::string &data) = 0;
    };

    // Writes to a connected socket, retrying partial writes and EINTR.
    // Throws std::runtime_error when the peer is gone or the write times out.
    class SocketSink: public ByteSink {
    public:
        explicit SocketSink(int fd) : fd(fd) {}
        void write(const std::string &data) override;
    private:
        int fd;
    };

    // Collects everything written; used where the bytes are inspected rather than sent.
    class StringSink: public ByteSink {
    public:
        void write(const std::string &data) override { buffer += data; }
        const std::string &str() const { return buffer; }
        void clear() { buffer.clear(); }
    private:
        std::string buffer;
    };
}

#endif
