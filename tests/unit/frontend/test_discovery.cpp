#include "rkg/frontend/discovery.hpp"
#include "rkg/utils/file_utils.hpp"

#include <gtest/gtest.h>

namespace rkg::frontend
{
    class DiscoveryTest : public ::testing::Test {
    protected:
        void SetUp() override {
            root_ = fs::temp_directory_path() / "rkg_discovery_test";
            std::error_code ec;
            fs::remove_all(root_, ec);

            for (const auto* path : {
                     "src/app.ts", "src/view.tsx", "lib/legacy.js", "lib/widget.jsx",
                     "src/types.d.ts", "src/app.test.ts", "src/view.spec.tsx",
                     "node_modules/pkg/index.js", "dist/bundle.js", "build/out.js",
                     "coverage/lcov.js", ".rkg/cache.js", "src/generated/api.ts", "README.md"}) {
                ASSERT_TRUE(file_utils::write_file(root_ / path, "export {};\n").is_ok());
            }
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }

        fs::path root_;
    };

    TEST_F(DiscoveryTest, FindsSourceFilesSorted) {
        const auto files = discover_source_files(root_);
        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(files.value(), (std::vector<std::string>{
            "lib/legacy.js", "lib/widget.jsx", "src/app.ts", "src/generated/api.ts", "src/view.tsx"}));
    }

    TEST_F(DiscoveryTest, AppliesExcludeSubstrings) {
        const auto files = discover_source_files(root_, {}, {"generated/", "lib/"});
        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(files.value(), (std::vector<std::string>{"src/app.ts", "src/view.tsx"}));
    }

    TEST_F(DiscoveryTest, CustomExtensions) {
        const auto files = discover_source_files(root_, {".jsx"});
        ASSERT_TRUE(files.is_ok());
        EXPECT_EQ(files.value(), std::vector<std::string>{"lib/widget.jsx"});
    }

    TEST_F(DiscoveryTest, MissingRoot) {
        const auto files = discover_source_files(root_ / "absent");
        ASSERT_TRUE(files.is_err());
        EXPECT_EQ(files.error().code(), ErrorCode::NotFound);
    }

    TEST(DiscoveryFilterTest, ExcludedFileSuffixes) {
        EXPECT_TRUE(is_excluded_file("src/types.d.ts"));
        EXPECT_TRUE(is_excluded_file("src/a.test.tsx"));
        EXPECT_TRUE(is_excluded_file("src/a.spec.ts"));
        EXPECT_FALSE(is_excluded_file("src/spec.ts"));
        EXPECT_FALSE(is_excluded_file("src/a.test.js"));
    }

}  // namespace rkg::frontend
