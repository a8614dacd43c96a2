#include "rkg/frontend/discovery.hpp"
#include "rkg/utils/path_utils.hpp"
#include "rkg/utils/string_utils.hpp"

#include <algorithm>

namespace rkg::frontend {

    const std::vector<std::string>& default_source_extensions() {
        static const std::vector<std::string> extensions = {".ts", ".tsx", ".js", ".jsx"};
        return extensions;
    }

    const std::vector<std::string>& ignored_directories() {
        static const std::vector<std::string> dirs = {
            "node_modules", "dist", "build", ".git", "coverage", ".rkg"
        };
        return dirs;
    }

    bool is_excluded_file(const std::string& relative_path) {
        static const std::vector<std::string> suffixes = {
            ".d.ts", ".test.ts", ".test.tsx", ".spec.ts", ".spec.tsx"
        };
        return std::ranges::any_of(suffixes, [&](const std::string& suffix) {
            return string_utils::ends_with(relative_path, suffix);
        });
    }

    Result<std::vector<std::string>, Error> discover_source_files(
        const fs::path& root,
        const std::vector<std::string>& extensions,
        const std::vector<std::string>& excludes
    ) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::not_found("Root directory not found", root.string())
            );
        }

        const auto& accepted = extensions.empty() ? default_source_extensions() : extensions;
        const auto& skip_dirs = ignored_directories();

        std::vector<std::string> files;
        auto it = fs::recursive_directory_iterator(
            root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::io_error("Failed to list directory", root.string())
            );
        }

        for (const auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                return Result<std::vector<std::string>, Error>::failure(
                    Error::io_error("Failed to walk directory", ec.message())
                );
            }

            const auto& entry = *it;
            const auto name = entry.path().filename().string();

            if (entry.is_directory(ec)) {
                if (std::ranges::find(skip_dirs, name) != skip_dirs.end()) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!entry.is_regular_file(ec)) {
                continue;
            }

            const auto ext = entry.path().extension().string();
            if (std::ranges::find(accepted, ext) == accepted.end()) {
                continue;
            }

            auto relative = path_utils::to_forward_slashes(
                path_utils::make_relative(entry.path(), root));
            if (is_excluded_file(relative)) {
                continue;
            }
            if (std::ranges::any_of(excludes, [&](const std::string& pattern) {
                    return !pattern.empty() && string_utils::contains(relative, pattern);
                })) {
                continue;
            }

            files.push_back(std::move(relative));
        }

        std::ranges::sort(files);
        return Result<std::vector<std::string>, Error>::success(std::move(files));
    }

}  // namespace rkg::frontend
