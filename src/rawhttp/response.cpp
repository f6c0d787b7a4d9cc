#include <rawhttp/response.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace {
    bool iequals(const std::string &a, const std::string &b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) == std::tolower(y);
        });
    }
}

rawhttp::HTTP_Response::HTTP_Response(ByteSink &sink, const compression::Compressor *compressor)
    : sink(sink), compressor(compressor) {}

rawhttp::HTTP_Response &rawhttp::HTTP_Response::status(HTTP_STATUS_CODE code) {
    this->code = code;
    return *this;
}

rawhttp::HTTP_Response &rawhttp::HTTP_Response::header(const std::string &name, const std::string &value) {
    auto it = find_header(name);
    if(it != header_list.end()) {
        it->second = value;
    } else {
        header_list.emplace_back(name, value);
    }
    return *this;
}

std::optional<std::string> rawhttp::HTTP_Response::header_value(const std::string &name) const {
    for(const auto &[key, value] : header_list) {
        if(iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

rawhttp::HeaderList::iterator rawhttp::HTTP_Response::find_header(const std::string &name) {
    return std::find_if(header_list.begin(), header_list.end(), [&](const auto &entry) {
        return iequals(entry.first, name);
    });
}

void rawhttp::HTTP_Response::send() {
    finish(std::nullopt, nullptr);
}

void rawhttp::HTTP_Response::send(const std::string &text) {
    finish(text, "text/plain");
}

void rawhttp::HTTP_Response::send(const char *text) {
    finish(std::string(text ? text : ""), "text/plain");
}

void rawhttp::HTTP_Response::send(const Bytes &data) {
    finish(std::string(data.begin(), data.end()), "application/octet-stream");
}

void rawhttp::HTTP_Response::send(const nlohmann::json &data) {
    finish(data.dump(), "application/json");
}

void rawhttp::HTTP_Response::finish(std::optional<std::string> body, const char *content_type) {
    if(is_sent) {
        throw std::logic_error("Response already sent");
    }

    if(body) {
        if(find_header("Content-Type") == header_list.end()) {
            header("Content-Type", content_type);
        }
        header("Content-Length", std::to_string(body->size()));

        if(compressor) {
            // On failure the uncompressed body goes out with the headers set above
            if(auto compressed = compressor->compress(*body)) {
                *body = std::move(*compressed);
                header("Content-Length", std::to_string(body->size()));
                header("Content-Encoding", compressor->encoding_name());
            } else {
                std::cerr << "Compression with " << compressor->encoding_name()
                          << " failed, sending identity body" << std::endl;
            }
        }
    }
    payload = std::move(body);

    std::string wire = to_string();
    is_sent = true;
    sink.write(wire);
}

std::string rawhttp::HTTP_Response::to_string() const {
    std::stringstream ss;

    // Status line
    ss << "HTTP/1.1 " << static_cast<int>(code) << " " << reason_phrase(code) << "\r\n";

    // Headers
    for(const auto &[name, value] : header_list) {
        ss << name << ": " << value << "\r\n";
    }

    // Empty line separator
    ss << "\r\n";

    // Body
    if(payload) {
        ss << *payload;
    }

    return ss.str();
}
