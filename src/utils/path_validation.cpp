#include <utils/path_validation.hpp>

#include <stdexcept>
#include <iterator>         // std::next

namespace fs = std::filesystem;

namespace rawhttp::path_validation {
    bool is_path_inside_directory(const fs::path& path, const fs::path& directory) {
        // weakly_canonical tolerates a path whose last components do not exist yet
        fs::path abs_directory = fs::weakly_canonical(fs::absolute(directory));
        fs::path abs_path = fs::weakly_canonical(fs::absolute(path));

        auto it1 = abs_path.begin();
        for (auto it2 = abs_directory.begin(); it2 != abs_directory.end(); ++it2, ++it1) {
            if (it2->empty() && std::next(it2) == abs_directory.end()) {
                break; // trailing separator
            }
            if (it1 == abs_path.end() || *it1 != *it2) {
                return false;
            }
        }
        return it1 != abs_path.end();
    }

    std::string validate_file_path(const std::string& directory_root, const std::string& file_name) {
        fs::path name = file_name;
        if (file_name.empty() || name.has_parent_path() || name.is_absolute()
            || file_name == "." || file_name == "..") {
            throw std::runtime_error("Invalid file name: " + file_name);
        }

        fs::path full_path = fs::path(directory_root) / name;
        if (!is_path_inside_directory(full_path, directory_root)) {
            throw std::runtime_error("Directory traversal attempt detected: " + file_name);
        }
        return full_path.string();
    }
}
