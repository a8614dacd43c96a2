#ifndef RKG_FILE_UTILS_HPP
#define RKG_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief Filesystem helpers returning Result<T, Error>.
 */

#include "rkg/error.hpp"
#include "rkg/result.hpp"
#include "rkg/types.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace rkg::file_utils {

    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();
        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Writes content, creating parent directories as needed.
     */
    inline Result<void, Error> write_file(const fs::path& path, const std::string_view content) {
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    inline Result<fs::file_time_type, Error> last_modified(const fs::path& path) {
        std::error_code ec;
        auto time = fs::last_write_time(path, ec);
        if (ec) {
            return Result<fs::file_time_type, Error>::failure(
                Error::not_found("Failed to get modification time", path.string())
            );
        }
        return Result<fs::file_time_type, Error>::success(time);
    }

    /**
     * Removes a file if present. A missing file is not an error.
     */
    inline Result<void, Error> remove_file(const fs::path& path) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to remove file", path.string())
            );
        }
        return Result<void, Error>::success();
    }

}  // namespace rkg::file_utils

#endif  // RKG_FILE_UTILS_HPP
