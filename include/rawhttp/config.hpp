#ifndef RAWHTTP_CONFIG_HPP
#define RAWHTTP_CONFIG_HPP
#include <cstddef>
#include <cstdint>

namespace rawhttp::config {
    inline constexpr int BUF_LEN                    = 1024;
    inline constexpr uint16_t DEFAULT_PORT          = 4221;
    inline constexpr char DEFAULT_HOST[]            = "127.0.0.1";
    inline constexpr int CONNECTION_TIMEOUT         = 30; // seconds
    inline constexpr int BACKLOG_SIZE               = 10;
    inline constexpr int POLL_TIMEOUT_MS            = 200;
    inline constexpr std::size_t MAX_REQUEST_SIZE   = 8 * 1024 * 1024;
    inline constexpr char DEFAULT_ROOT_PATH[]       = ".";
}

#endif
