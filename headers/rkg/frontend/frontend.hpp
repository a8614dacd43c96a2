#ifndef RKG_FRONTEND_FRONTEND_HPP
#define RKG_FRONTEND_FRONTEND_HPP

/**
 * @file frontend.hpp
 * @brief Parser front end interface and registry.
 *
 * The graph builder never parses source itself. It asks a FrontendRegistry
 * for the front end that supports a path and consumes the ParsedFile it
 * returns. Front ends must allow concurrent parse() calls on different
 * files, because the builder runs extraction tasks in parallel.
 */

#include "rkg/error.hpp"
#include "rkg/result.hpp"
#include "rkg/types.hpp"
#include "rkg/frontend/syntax.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace rkg::frontend {

    class IParserFrontend {
    public:
        virtual ~IParserFrontend() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Whether this front end can parse the given root-relative path.
         */
        [[nodiscard]] virtual bool supports(const std::string& path) const = 0;

        /**
         * Parses root/path into a syntax tree.
         *
         * @param root Repository root.
         * @param path Root-relative path with forward slashes.
         * @return The parsed file or a ParseError / IoError.
         */
        [[nodiscard]] virtual Result<ParsedFile, Error> parse(
            const fs::path& root,
            const std::string& path
        ) const = 0;
    };

    /**
     * Ordered list of front ends. The first one supporting a path wins.
     */
    class FrontendRegistry {
    public:
        void register_frontend(std::shared_ptr<IParserFrontend> frontend);

        [[nodiscard]] std::shared_ptr<IParserFrontend> find_frontend_for(const std::string& path) const;

        [[nodiscard]] std::vector<std::shared_ptr<IParserFrontend>> list_frontends() const;

        [[nodiscard]] bool empty() const noexcept { return frontends_.empty(); }

    private:
        std::vector<std::shared_ptr<IParserFrontend>> frontends_;
    };

    /**
     * Registry holding every front end compiled into this build.
     * Empty when no real parser is available.
     */
    [[nodiscard]] FrontendRegistry default_frontends();

    /**
     * Front end serving pre-built trees.
     *
     * Used by embedders that parse elsewhere and by tests. Per-file delays
     * and failures can be injected to exercise the builder's timeout and
     * error paths. Configure before handing it to a builder; parse() only
     * reads.
     */
    class InMemoryFrontend : public IParserFrontend {
    public:
        explicit InMemoryFrontend(std::string name = "in-memory");

        void add_file(ParsedFile file);

        void set_delay(const std::string& path, Duration delay);

        /**
         * parse() will return this error for path.
         */
        void set_failure(const std::string& path, Error error);

        /**
         * parse() will throw std::runtime_error(message) for path.
         */
        void set_throw(const std::string& path, std::string message);

        /**
         * Every known path, sorted.
         */
        [[nodiscard]] std::vector<std::string> paths() const;

        [[nodiscard]] std::string_view name() const noexcept override { return name_; }

        [[nodiscard]] bool supports(const std::string& path) const override;

        [[nodiscard]] Result<ParsedFile, Error> parse(
            const fs::path& root,
            const std::string& path
        ) const override;

    private:
        std::string name_;
        std::map<std::string, ParsedFile> files_;
        std::map<std::string, Duration> delays_;
        std::map<std::string, Error> failures_;
        std::map<std::string, std::string> throws_;
    };

}  // namespace rkg::frontend

#endif  // RKG_FRONTEND_FRONTEND_HPP
