#ifndef RAWHTTP_GZIP_HPP
#define RAWHTTP_GZIP_HPP
#include "compressor.hpp"

namespace rawhttp::compression {
    class GzipCompressor: public Compressor {
    public:
        std::optional<std::string> compress(const std::string &data) const override;
        std::string encoding_name() const override {
            return "gzip";
        }
    };
}

#endif
