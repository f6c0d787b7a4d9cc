#include <rawhttp/request_buffer.hpp>
#include <rawhttp/request.hpp>      // normalize_header_name
#include <algorithm>       // std::min
#include <iostream>
#include <stdexcept>

rawhttp::RequestBuffer::RequestBuffer(std::size_t max_size) : max_size(max_size) {}

void rawhttp::RequestBuffer::append(const char *data, std::size_t len) {
    buffer.append(data, len);
}

std::optional<std::string> rawhttp::RequestBuffer::next() {
    if(buffer.empty()) {
        return std::nullopt;
    }

    size_t sep = buffer.find("\r\n\r\n");
    if(sep == std::string::npos) {
        if(buffer.size() < max_size) {
            return std::nullopt;
        }
        std::cerr << "Request header block exceeds " << max_size << " bytes, dispatching as-is" << std::endl;
        std::string message;
        message.swap(buffer);
        return message;
    }

    size_t body_len = std::min(content_length(buffer.substr(0, sep)), max_size);
    size_t needed = sep + 4 + body_len;
    if(buffer.size() < needed) {
        if(buffer.size() < max_size) {
            return std::nullopt;
        }
        std::cerr << "Request body exceeds " << max_size << " bytes, truncating" << std::endl;
        needed = buffer.size();
    }

    std::string message = buffer.substr(0, needed);
    buffer.erase(0, needed);
    return message;
}

std::size_t rawhttp::RequestBuffer::content_length(const std::string &header_block) {
    size_t start = header_block.find("\r\n");
    while(start != std::string::npos) {
        start += 2;
        size_t end = header_block.find("\r\n", start);
        std::string line = header_block.substr(start, end == std::string::npos ? std::string::npos : end - start);
        size_t colon = line.find(':');
        if(colon != std::string::npos && normalize_header_name(line.substr(0, colon)) == "content_length") {
            std::string value = line.substr(colon + 1);
            size_t digits = value.find_first_not_of(" \t");
            if(digits != std::string::npos && value[digits] == '-') {
                // stoul would wrap a negative length around to a huge one
                std::cerr << "Invalid Content-Length header: " << value << std::endl;
                return 0;
            }
            try {
                return std::stoul(value);
            } catch (const std::exception& e) {
                std::cerr << "Invalid Content-Length header: " << e.what() << std::endl;
                return 0;
            }
        }
        start = end;
    }
    return 0;
}
