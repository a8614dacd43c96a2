#include "rkg/utils/file_utils.hpp"
#include "rkg/utils/json_utils.hpp"

#include <gtest/gtest.h>
#include <fstream>

namespace rkg
{
    class FileUtilsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "rkg_file_utils_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }

        fs::path temp_dir_;
    };

    TEST_F(FileUtilsTest, WriteCreatesParentsAndReadsBack) {
        const auto path = temp_dir_ / "a" / "b" / "c.txt";
        ASSERT_TRUE(file_utils::write_file(path, "line1\nline2").is_ok());

        const auto content = file_utils::read_file(path);
        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), "line1\nline2");
    }

    TEST_F(FileUtilsTest, ReadMissingFile) {
        const auto content = file_utils::read_file(temp_dir_ / "missing.txt");
        ASSERT_TRUE(content.is_err());
        EXPECT_EQ(content.error().code(), ErrorCode::NotFound);
        EXPECT_EQ(content.error().message(), "File not found");
    }

    TEST_F(FileUtilsTest, LastModified) {
        const auto path = temp_dir_ / "stamp.txt";
        ASSERT_TRUE(file_utils::write_file(path, "x").is_ok());
        EXPECT_TRUE(file_utils::last_modified(path).is_ok());
        EXPECT_TRUE(file_utils::last_modified(temp_dir_ / "nope").is_err());
    }

    TEST_F(FileUtilsTest, RemoveMissingFileIsOk) {
        EXPECT_TRUE(file_utils::remove_file(temp_dir_ / "never-existed").is_ok());

        const auto path = temp_dir_ / "gone.txt";
        ASSERT_TRUE(file_utils::write_file(path, "x").is_ok());
        ASSERT_TRUE(file_utils::remove_file(path).is_ok());
        EXPECT_FALSE(fs::exists(path));
    }

    TEST_F(FileUtilsTest, JsonRoundTrip) {
        const auto path = temp_dir_ / "data.json";
        json_utils::json data = {{"name", "graph"}, {"count", 3}};
        ASSERT_TRUE(json_utils::write_file(path, data).is_ok());

        const auto loaded = json_utils::read_file(path);
        ASSERT_TRUE(loaded.is_ok());
        EXPECT_EQ(loaded.value(), data);
        EXPECT_EQ(json_utils::get_or<int>(loaded.value(), "count", 0), 3);
        EXPECT_EQ(json_utils::get_or<int>(loaded.value(), "absent", 9), 9);
        EXPECT_EQ(json_utils::get_or<int>(loaded.value(), "name", 9), 9);
    }

    TEST_F(FileUtilsTest, JsonParseError) {
        const auto path = temp_dir_ / "broken.json";
        ASSERT_TRUE(file_utils::write_file(path, "{\"nodes\": [").is_ok());

        const auto loaded = json_utils::read_file(path);
        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(loaded.error().message(), "JSON parse error");
    }

}  // namespace rkg
