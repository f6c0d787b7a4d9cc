#ifndef RAWHTTP_FILE_UTILS_HPP
#define RAWHTTP_FILE_UTILS_HPP

#include <string>
#include <optional>
namespace rawhttp::file_utils {
    // Whole file as bytes; std::nullopt if it is missing or unreadable
    std::optional<std::string> read_file(const std::string& file_path);

    // Overwrites an existing file. Throws std::runtime_error on failure.
    void save_file(const std::string& file_path, const std::string& content);
}

#endif
