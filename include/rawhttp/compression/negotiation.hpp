#ifndef RAWHTTP_NEGOTIATION_HPP
#define RAWHTTP_NEGOTIATION_HPP
#include "compressor.hpp"
#include <rawhttp/request.hpp>
#include <memory>
#include <vector>

namespace rawhttp::compression {
    using Compressors = std::vector<std::unique_ptr<Compressor>>;

    // True if the comma-separated Accept-Encoding value lists `encoding`.
    bool accepts_encoding(const std::string &accept_encoding, const std::string &encoding);

    // The encoding decision for one request: first offered compressor the
    // client accepts, or nullptr for identity.
    const Compressor *select_compressor(const HTTP_Request &request, const Compressors &offered);

    Compressors default_compressors();
}

#endif
