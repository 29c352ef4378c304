/**
 * @file test_error.cpp
 * @brief Unit tests for Error and the Result helpers
 */

#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <vector>

#include "digistream/wire/utils/Error.hpp"

using namespace DIGISTREAM::Wire;

TEST(ErrorTest, StoresCodeAndMessage)
{
    Error error(Error::TRUNCATED_BUFFER, "short buffer");
    EXPECT_EQ(error.code, Error::TRUNCATED_BUFFER);
    EXPECT_EQ(error.message, "short buffer");
    EXPECT_FALSE(error.system_errno.has_value());
    EXPECT_FALSE(error.timestamp.empty());
}

TEST(ErrorTest, SystemErrnoIsAppendedToMessage)
{
    Error error(Error::SYSTEM_ERROR, "open failed", ENOENT);
    ASSERT_TRUE(error.system_errno.has_value());
    EXPECT_EQ(*error.system_errno, ENOENT);
    EXPECT_NE(error.message.find("errno: " + std::to_string(ENOENT)), std::string::npos);
}

TEST(ErrorTest, OnlyBadIdentifierIsForeignBuffer)
{
    EXPECT_TRUE(Error(Error::BAD_IDENTIFIER, "").isForeignBuffer());
    EXPECT_FALSE(Error(Error::TRUNCATED_BUFFER, "").isForeignBuffer());
    EXPECT_FALSE(Error(Error::MISSING_REQUIRED_FIELD, "").isForeignBuffer());
}

TEST(ErrorTest, ErrorCodeToString)
{
    EXPECT_STREQ(errorCodeToString(Error::SUCCESS), "SUCCESS");
    EXPECT_STREQ(errorCodeToString(Error::BAD_IDENTIFIER), "BAD_IDENTIFIER");
    EXPECT_STREQ(errorCodeToString(Error::ZERO_SAMPLE_RATE), "ZERO_SAMPLE_RATE");
    EXPECT_STREQ(errorCodeToString(Error::DUPLICATE_CHANNEL), "DUPLICATE_CHANNEL");
    EXPECT_STREQ(errorCodeToString(Error::SYSTEM_ERROR), "SYSTEM_ERROR");
}

#ifndef NDEBUG
TEST(ErrorTest, StackTraceCapturedInDebugBuilds)
{
    Error error(Error::INVALID_FORMAT, "trace");
    EXPECT_FALSE(error.stack_trace.empty());
}
#endif

TEST(ResultTest, OkAndErrHelpers)
{
    Result<int> ok = Ok(42);
    ASSERT_TRUE(isOk(ok));
    EXPECT_EQ(getValue(ok), 42);

    Result<int> failed = Err<int>(Error(Error::INVALID_CONFIG, "bad"));
    ASSERT_FALSE(isOk(failed));
    EXPECT_EQ(getError(failed).code, Error::INVALID_CONFIG);
}

TEST(ResultTest, TakeValueMovesOut)
{
    Result<std::vector<int>> result = std::vector<int>{1, 2, 3};
    std::vector<int> values = takeValue(std::move(result));
    EXPECT_EQ(values.size(), 3u);
}

TEST(ResultTest, StatusSuccess)
{
    Status status = std::monostate{};
    EXPECT_TRUE(isOk(status));

    Status failed = Error(Error::SYSTEM_ERROR, "failed");
    EXPECT_FALSE(isOk(failed));
}
