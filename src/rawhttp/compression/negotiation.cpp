#include <rawhttp/compression/negotiation.hpp>
#include <rawhttp/compression/gzip.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace rawhttp::compression {
    namespace {
        std::string trim(const std::string &s) {
            size_t first = s.find_first_not_of(" \t");
            if(first == std::string::npos) {
                return "";
            }
            size_t last = s.find_last_not_of(" \t");
            return s.substr(first, last - first + 1);
        }

        bool iequals(const std::string &a, const std::string &b) {
            return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                return std::tolower(x) == std::tolower(y);
            });
        }
    }

    bool accepts_encoding(const std::string &accept_encoding, const std::string &encoding) {
        std::istringstream encodings(accept_encoding);
        std::string entry;
        while(std::getline(encodings, entry, ',')) {
            if(iequals(trim(entry), encoding)) {
                return true;
            }
        }
        return false;
    }

    const Compressor *select_compressor(const HTTP_Request &request, const Compressors &offered) {
        auto it = request.headers.find("accept_encoding");
        if(it == request.headers.end()) {
            return nullptr;
        }
        for(const auto &compressor : offered) {
            if(accepts_encoding(it->second, compressor->encoding_name())) {
                return compressor.get();
            }
        }
        return nullptr;
    }

    Compressors default_compressors() {
        Compressors compressors;
        compressors.push_back(std::make_unique<GzipCompressor>());
        return compressors;
    }
}
