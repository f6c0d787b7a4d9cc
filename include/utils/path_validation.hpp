#ifndef RAWHTTP_PATH_VALIDATION_HPP
#define RAWHTTP_PATH_VALIDATION_HPP

#include <filesystem>
#include <string>
namespace rawhttp::path_validation {
    bool is_path_inside_directory(const std::filesystem::path& path, const std::filesystem::path& directory);

    // directory_root / file_name, or std::runtime_error if the result escapes directory_root
    std::string validate_file_path(const std::string& directory_root, const std::string& file_name);
}

#endif
