#include "rkg/utils/path_utils.hpp"

#include <gtest/gtest.h>

namespace rkg::path_utils
{
    TEST(PathUtilsTest, NormalizeCollapsesDots) {
        EXPECT_EQ(to_forward_slashes(normalize("src/./lib/../utils/x.ts")), "src/utils/x.ts");
        EXPECT_EQ(to_forward_slashes(normalize("a/b/../../c")), "c");
    }

    TEST(PathUtilsTest, NormalizeKeepsLeadingParent) {
        EXPECT_EQ(to_forward_slashes(normalize("src/../../outside.ts")), "../outside.ts");
    }

    TEST(PathUtilsTest, Segments) {
        EXPECT_EQ(segments("src/auth//login.ts"), (std::vector<std::string>{"src", "auth", "login.ts"}));
        EXPECT_TRUE(segments("").empty());
    }

    TEST(PathUtilsTest, DirnameAndBasename) {
        EXPECT_EQ(dirname("src/auth/login.ts"), "src/auth");
        EXPECT_EQ(dirname("index.ts"), "");
        EXPECT_EQ(basename("src/auth/login.ts"), "login.ts");
        EXPECT_EQ(basename("index.ts"), "index.ts");
    }

    TEST(PathUtilsTest, MakeRelative) {
        EXPECT_EQ(to_forward_slashes(make_relative("/repo/src/a.ts", "/repo")), "src/a.ts");
    }

}  // namespace rkg::path_utils
