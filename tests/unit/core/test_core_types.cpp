/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes and result<T>
 */

#include <gtest/gtest.h>

#include <kcenon/file_drop/core/types.h>

#include <memory>
#include <string>

namespace kcenon::file_drop::test {

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // File errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::invalid_range), -103);

    // Message errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::malformed_message), -120);

    // Configuration errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::invalid_message_size), -140);
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -141);

    // Channel errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::channel_create_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::channel_send_failed), -163);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::file_read_error), "file read error");
    EXPECT_STREQ(to_string(error_code::channel_closed), "channel closed");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, ErrorFromCodeUsesDefaultMessage) {
    error err(error_code::channel_not_open);

    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "channel not open");
}

TEST_F(ErrorCodeTest, DefaultErrorIsSuccess) {
    error err;

    EXPECT_FALSE(static_cast<bool>(err));
    EXPECT_EQ(err.code, error_code::success);
}

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r(42);

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<int> r = unexpected(error{error_code::invalid_range, "past the end"});

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_range);
    EXPECT_EQ(r.error().message, "past the end");
}

TEST_F(ResultTest, MovesOutMoveOnlyValue) {
    result<std::unique_ptr<std::string>> r(std::make_unique<std::string>("payload"));

    ASSERT_TRUE(r);
    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, "payload");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    result<void> failed = unexpected(error{error_code::channel_closed});

    EXPECT_TRUE(ok.has_value());
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::channel_closed);
}

}  // namespace kcenon::file_drop::test
