/**
 * @file test_drop_config.cpp
 * @brief Unit tests for drop_config
 */

#include <gtest/gtest.h>

#include <kcenon/file_drop/core/drop_config.h>

#include <cstdlib>

namespace kcenon::file_drop::test {

class DropConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        ::unsetenv(drop_config::message_size_env);
        ::unsetenv(drop_config::log_level_env);
    }
};

TEST_F(DropConfigTest, DefaultValues) {
    drop_config config;

    EXPECT_EQ(config.max_message_size, drop_config::default_message_size);
    EXPECT_EQ(config.max_message_size, 64u * 1024u);
    EXPECT_EQ(config.min_log_level, log_level::info);
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(DropConfigTest, BoundsAreValid) {
    EXPECT_TRUE(drop_config(drop_config::min_message_size).validate().has_value());
    EXPECT_TRUE(drop_config(drop_config::max_message_size_limit).validate().has_value());
}

TEST_F(DropConfigTest, TooSmall) {
    auto result = drop_config(drop_config::min_message_size - 1).validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_message_size);
}

TEST_F(DropConfigTest, ZeroIsRejected) {
    auto result = drop_config(0).validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_message_size);
}

TEST_F(DropConfigTest, TooLarge) {
    auto result = drop_config(drop_config::max_message_size_limit + 1).validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_message_size);
}

TEST_F(DropConfigTest, CalculateMessageCount) {
    drop_config config(65536);

    EXPECT_EQ(config.calculate_message_count(0), 0u);
    EXPECT_EQ(config.calculate_message_count(1), 1u);
    EXPECT_EQ(config.calculate_message_count(65536), 1u);
    EXPECT_EQ(config.calculate_message_count(65537), 2u);
    EXPECT_EQ(config.calculate_message_count(250000), 4u);
}

TEST_F(DropConfigTest, FromEnvironmentDefaults) {
    auto config = drop_config::from_environment();

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().max_message_size, drop_config::default_message_size);
    EXPECT_EQ(config.value().min_log_level, log_level::info);
}

TEST_F(DropConfigTest, FromEnvironmentReadsValues) {
    ::setenv(drop_config::message_size_env, "16384", 1);
    ::setenv(drop_config::log_level_env, "Debug", 1);

    auto config = drop_config::from_environment();

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().max_message_size, 16384u);
    EXPECT_EQ(config.value().min_log_level, log_level::debug);
}

TEST_F(DropConfigTest, FromEnvironmentRejectsGarbageSize) {
    ::setenv(drop_config::message_size_env, "64k", 1);

    auto config = drop_config::from_environment();

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);
}

TEST_F(DropConfigTest, FromEnvironmentRejectsUnknownLevel) {
    ::setenv(drop_config::log_level_env, "verbose", 1);

    auto config = drop_config::from_environment();

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_configuration);
}

TEST_F(DropConfigTest, FromEnvironmentValidatesSize) {
    ::setenv(drop_config::message_size_env, "512", 1);

    auto config = drop_config::from_environment();

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, error_code::invalid_message_size);
}

}  // namespace kcenon::file_drop::test
