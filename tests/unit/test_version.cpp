/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/media_transfer/media_transfer.h>

#include <type_traits>

namespace kcenon::media_transfer::test {

class VersionTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(VersionTest, MajorVersionIsCorrect) {
    EXPECT_EQ(version::major, 0);
}

TEST_F(VersionTest, MinorVersionIsCorrect) {
    EXPECT_EQ(version::minor, 1);
}

TEST_F(VersionTest, PatchVersionIsCorrect) {
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST_F(VersionTest, VersionStringFormat) {
    auto ver = version::to_string();
    EXPECT_FALSE(ver.empty());

    // Should contain dots
    EXPECT_NE(ver.find('.'), std::string::npos);
}

TEST_F(VersionTest, UmbrellaHeaderExposesEngine) {
    EXPECT_TRUE(std::is_move_constructible_v<media_transfer_engine>);
    EXPECT_FALSE(std::is_copy_constructible_v<media_transfer_engine>);
    EXPECT_TRUE((std::is_base_of_v<part_store, memory_part_store>));
    EXPECT_TRUE((std::is_base_of_v<part_store, local_part_store>));
}

}  // namespace kcenon::media_transfer::test
