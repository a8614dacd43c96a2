#include "rkg/error.hpp"
#include "rkg/result.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace rkg
{
    // =============================================================================
    // Error
    // =============================================================================

    TEST(ErrorTest, FactoriesSetCode) {
        EXPECT_EQ(Error::invalid_argument("x").code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(Error::not_found("x").code(), ErrorCode::NotFound);
        EXPECT_EQ(Error::parse_error("x").code(), ErrorCode::ParseError);
        EXPECT_EQ(Error::io_error("x").code(), ErrorCode::IoError);
        EXPECT_EQ(Error::config_error("x").code(), ErrorCode::ConfigError);
        EXPECT_EQ(Error::analysis_error("x").code(), ErrorCode::AnalysisError);
        EXPECT_EQ(Error::timeout("x").code(), ErrorCode::Timeout);
        EXPECT_EQ(Error::git_error("x").code(), ErrorCode::GitError);
        EXPECT_EQ(Error::index_error("x").code(), ErrorCode::IndexError);
        EXPECT_EQ(Error::internal_error("x").code(), ErrorCode::InternalError);
    }

    TEST(ErrorTest, EmptyContextIsAbsent) {
        const auto error = Error::not_found("missing", "");
        EXPECT_FALSE(error.has_context());
        EXPECT_EQ(error.to_string(), "[NotFound] missing");
    }

    TEST(ErrorTest, ToStringIncludesContext) {
        const auto error = Error::parse_error("JSON parse error", "graph.json");
        EXPECT_EQ(error.to_string(), "[ParseError] JSON parse error (context: graph.json)");
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto error = Error::io_error("read failed").with_context("a.ts").with_context("scan");
        ASSERT_TRUE(error.has_context());
        EXPECT_EQ(error.context().value(), "a.ts; scan");
        EXPECT_EQ(error.message(), "read failed");
    }

    TEST(ErrorTest, StreamOperator) {
        std::ostringstream os;
        os << Error::index_error("no index");
        EXPECT_EQ(os.str(), "[IndexError] no index");
    }

    // =============================================================================
    // Result
    // =============================================================================

    TEST(ResultTest, Success) {
        auto result = Result<int, Error>::success(42);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 42);
    }

    TEST(ResultTest, Failure) {
        auto result = Result<int, Error>::failure(Error::not_found("item"));

        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
        EXPECT_EQ(result.value_or(7), 7);
    }

    TEST(ResultTest, WrongAccessorThrows) {
        auto failed = Result<int, Error>::failure(Error::invalid_argument("bad"));
        EXPECT_THROW((void)failed.value(), std::logic_error);

        auto ok = Result<int, Error>::success(1);
        EXPECT_THROW((void)ok.error(), std::logic_error);
    }

    TEST(ResultTest, MapAndThen) {
        const auto doubled = Result<int, Error>::success(21).map([](const int v) { return v * 2; });
        ASSERT_TRUE(doubled.is_ok());
        EXPECT_EQ(doubled.value(), 42);

        auto chained = Result<int, Error>::success(5).and_then([](int v) {
            if (v > 3) {
                return Result<std::string, Error>::failure(Error::invalid_argument("too big"));
            }
            return Result<std::string, Error>::success(std::to_string(v));
        });
        ASSERT_TRUE(chained.is_err());
        EXPECT_EQ(chained.error().message(), "too big");
    }

    TEST(ResultTest, VoidResult) {
        const auto ok = Result<void, Error>::success();
        EXPECT_TRUE(ok.is_ok());

        const auto failed = Result<void, Error>::failure(Error::io_error("disk"));
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::IoError);
    }

}  // namespace rkg
