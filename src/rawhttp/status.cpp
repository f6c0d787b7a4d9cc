#include <rawhttp/status.hpp>
#include <stdexcept>
#include <string>

const char *rawhttp::reason_phrase(HTTP_STATUS_CODE code) {
    switch(code) {
        case HTTP_STATUS_CODE::OK:          return "OK";
        case HTTP_STATUS_CODE::CREATED:     return "Created";
        case HTTP_STATUS_CODE::NOT_FOUND:   return "Not Found";
    }
    throw std::invalid_argument("Unknown status code " + std::to_string(static_cast<int>(code)));
}
