/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/file_move/file_move.h>

#include <string>

namespace kcenon::file_move::test {

TEST(VersionTest, ComponentsMatchRelease) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 3);
    EXPECT_EQ(version::patch, 0);
}

TEST(VersionTest, StringJoinsComponents) {
    auto expected = std::to_string(version::major) + "." + std::to_string(version::minor) +
                    "." + std::to_string(version::patch);

    EXPECT_EQ(version::to_string(), expected);
    EXPECT_EQ(version::to_string(), "0.3.0");
}

}  // namespace kcenon::file_move::test
