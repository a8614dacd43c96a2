#ifndef RKG_FRONTEND_DISCOVERY_HPP
#define RKG_FRONTEND_DISCOVERY_HPP

/**
 * @file discovery.hpp
 * @brief Source file discovery under a repository root.
 */

#include "rkg/error.hpp"
#include "rkg/result.hpp"
#include "rkg/types.hpp"

#include <string>
#include <vector>

namespace rkg::frontend {

    /**
     * Extensions scanned when no patterns are configured.
     */
    [[nodiscard]] const std::vector<std::string>& default_source_extensions();

    /**
     * Directory names never descended into.
     */
    [[nodiscard]] const std::vector<std::string>& ignored_directories();

    /**
     * True for declaration files and test/spec files, which are never scanned.
     */
    [[nodiscard]] bool is_excluded_file(const std::string& relative_path);

    /**
     * Lists source files below root.
     *
     * @param root Repository root.
     * @param extensions Accepted extensions (".ts" etc.); empty for the defaults.
     * @param excludes Substrings; a path containing any of them is skipped.
     * @return Root-relative paths with forward slashes, sorted.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> discover_source_files(
        const fs::path& root,
        const std::vector<std::string>& extensions = {},
        const std::vector<std::string>& excludes = {}
    );

}  // namespace rkg::frontend

#endif  // RKG_FRONTEND_DISCOVERY_HPP
