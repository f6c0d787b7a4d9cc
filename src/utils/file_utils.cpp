#include <utils/file_utils.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <filesystem>

namespace rawhttp::file_utils {
    std::optional<std::string> read_file(const std::string& file_path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec)) {
            return std::nullopt;
        }

        std::ifstream file{file_path, std::ios::binary};
        if(!file) {
            std::cerr << "Failed to open file for reading: " << file_path << std::endl;
            return std::nullopt;
        }

        return std::string {
            std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()
        };
    }

    void save_file(const std::string& file_path, const std::string& content) {
        std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
        if(!file) {
            throw std::runtime_error("Failed to open file for writing: " + file_path);
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();
        if(!file) {
            throw std::runtime_error("Failed to write to file: " + file_path);
        }
    }
}
