/**
 * @file test_copy_config.cpp
 * @brief Unit tests for copy_config
 */

#include <gtest/gtest.h>

#include <kcenon/file_move/core/copy_config.h>

namespace kcenon::file_move::test {

class CopyConfigTest : public ::testing::Test {};

TEST_F(CopyConfigTest, DefaultIsOneMebibyte) {
    copy_config config;

    EXPECT_EQ(config.buffer_size, 1024u * 1024u);
    EXPECT_TRUE(config.preserve_permissions);
    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(CopyConfigTest, BoundsAreInclusive) {
    EXPECT_TRUE(copy_config(copy_config::min_buffer_size).validate().has_value());
    EXPECT_TRUE(copy_config(copy_config::max_buffer_size).validate().has_value());
}

TEST_F(CopyConfigTest, TooSmall) {
    auto result = copy_config(copy_config::min_buffer_size - 1).validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(CopyConfigTest, TooLarge) {
    auto result = copy_config(copy_config::max_buffer_size + 1).validate();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

}  // namespace kcenon::file_move::test
