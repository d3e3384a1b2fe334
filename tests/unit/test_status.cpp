#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/status.hpp"
#include <memory>
#include <string>

using namespace flowscope;

// Test Result<T, E> monad

TEST(StatusTest, OkCreation) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(StatusTest, ErrCreation) {
    auto result = Result<int, std::string>::Err("something failed");
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "something failed");
}

TEST(StatusTest, ValueThrowsOnError) {
    auto result = Result<int, std::string>::Err("error");
    EXPECT_THROW((void)result.value(), std::logic_error);
}

TEST(StatusTest, ErrorThrowsOnOk) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_THROW((void)result.error(), std::logic_error);
}

TEST(StatusTest, SameValueAndErrorType) {
    auto ok = Result<std::string, std::string>::Ok("value");
    auto err = Result<std::string, std::string>::Err("error");

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "error");
}

TEST(StatusTest, MapTransformsValue) {
    auto result = Result<int, std::string>::Ok(10);
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 20);
}

TEST(StatusTest, MapPreservesError) {
    auto result = Result<int, std::string>::Err("oops");
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), "oops");
}

TEST(StatusTest, ValueOrReturnsDefault) {
    auto ok = Result<int, std::string>::Ok(5);
    auto err = Result<int, std::string>::Err("nope");

    EXPECT_EQ(ok.value_or(0), 5);
    EXPECT_EQ(err.value_or(7), 7);
}

TEST(StatusTest, TakeValueMovesOnlyPayload) {
    auto result = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(3));
    auto owned = std::move(result).take_value();

    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 3);
}

TEST(StatusTest, UnitPayload) {
    auto result = Result<Unit, Error>::Ok(Unit{});
    EXPECT_TRUE(result.is_ok());
}

// ============================================================================
// Error values
// ============================================================================

TEST(ErrorTest, DescribeIncludesKind) {
    Error error{ErrorKind::PersistenceFailure, "disk full"};
    EXPECT_EQ(error.describe(), "PersistenceFailure: disk full");
}

TEST(ErrorTest, KindNames) {
    EXPECT_EQ(to_string(ErrorKind::DataGap), "DataGap");
    EXPECT_EQ(to_string(ErrorKind::ComputationFailure), "ComputationFailure");
    EXPECT_EQ(to_string(ErrorKind::ConfigurationError), "ConfigurationError");
}

TEST(ErrorTest, ConfigErrorIsInvalidArgument) {
    try {
        throw ConfigError("window.length_ms must be positive");
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("window.length_ms"), std::string::npos);
        return;
    }
    FAIL() << "ConfigError not caught as std::invalid_argument";
}
