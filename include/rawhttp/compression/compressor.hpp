#ifndef RAWHTTP_COMPRESSOR_HPP
#define RAWHTTP_COMPRESSOR_HPP

#include <string>
#include <optional>

namespace rawhttp::compression {
    inline constexpr int GZIP_BUF_LEN = 32768; // Output chunk size for deflate
    class Compressor {
    public:
        virtual ~Compressor() = default;
        // std::nullopt when the data could not be encoded
        virtual std::optional<std::string> compress(const std::string &data) const = 0;
        virtual std::string encoding_name() const = 0;
    };
}

#endif
