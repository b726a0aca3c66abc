/**
 * @file test_channel_label.cpp
 * @brief Unit tests for channel_label
 */

#include <gtest/gtest.h>

#include <kcenon/file_drop/core/channel_label.h>

#include <regex>
#include <set>
#include <string>

namespace kcenon::file_drop::test {

class ChannelLabelTest : public ::testing::Test {};

TEST_F(ChannelLabelTest, DefaultIsNull) {
    channel_label label;

    EXPECT_TRUE(label.is_null());
    EXPECT_EQ(label.to_string(), "00000000-0000-0000-0000-000000000000");
}

TEST_F(ChannelLabelTest, GeneratedIsVersion4) {
    auto label = channel_label::generate();
    auto text = label.to_string();

    EXPECT_FALSE(label.is_null());

    std::regex uuid_v4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    EXPECT_TRUE(std::regex_match(text, uuid_v4)) << text;
}

TEST_F(ChannelLabelTest, GeneratedLabelsAreDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(channel_label::generate().to_string());
    }

    EXPECT_EQ(seen.size(), 1000u);
}

TEST_F(ChannelLabelTest, ParsesItsOwnString) {
    auto label = channel_label::generate();

    auto parsed = channel_label::from_string(label.to_string());

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, label);
}

TEST_F(ChannelLabelTest, ParsesUppercase) {
    auto parsed = channel_label::from_string("0F1E2D3C-4B5A-4968-8776-A5B4C3D2E1F0");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->bytes[0], 0x0F);
    EXPECT_EQ(parsed->bytes[15], 0xF0);
}

TEST_F(ChannelLabelTest, RejectsMalformedStrings) {
    EXPECT_FALSE(channel_label::from_string("").has_value());
    EXPECT_FALSE(channel_label::from_string("not-a-uuid").has_value());
    EXPECT_FALSE(channel_label::from_string("0f1e2d3c-4b5a-4968-8776-a5b4c3d2e1").has_value());
    EXPECT_FALSE(channel_label::from_string("0f1e2d3c-4b5a-4968-8776-a5b4c3d2e1fz").has_value());
}

}  // namespace kcenon::file_drop::test
