/**
 * @file test_utils.cpp
 * @brief Unit tests for the size and duration formatting helpers
 *
 * @see formatBytes()
 * @see formatDuration()
 */

#include <gtest/gtest.h>
#include "utils.hpp"

/**
 * @test FormatsBytesCorrectly
 * @brief Verifies human-readable byte formatting across different scales
 *
 * Test cases:
 * - 0 bytes → "0 B"
 * - 512 bytes → "512 B"
 * - 2048 bytes (2 KiB) → "2.00 KB"
 * - 1536 bytes (1.5 KiB) → "1.50 KB"
 * - 1048576 bytes (1 MiB) → "1.00 MB"
 * - 1073741824 bytes (1 GiB) → "1.00 GB"
 */
TEST(UtilsTest, FormatsBytesCorrectly) {
    EXPECT_EQ(formatBytes(0), "0 B");
    EXPECT_EQ(formatBytes(512), "512 B");
    EXPECT_EQ(formatBytes(1023), "1023 B");
    EXPECT_EQ(formatBytes(2048), "2.00 KB");
    EXPECT_EQ(formatBytes(1536), "1.50 KB");
    EXPECT_EQ(formatBytes(1048576), "1.00 MB");
    EXPECT_EQ(formatBytes(1073741824), "1.00 GB");
}

TEST(UtilsTest, LargestUnitIsTerabytes) {
    const std::uint64_t pb = 1024ULL * 1024 * 1024 * 1024 * 1024;
    EXPECT_EQ(formatBytes(pb), "1024.00 TB");
}

/**
 * @test FormatsDurationCorrectly
 * @brief Verifies the four duration ranges
 *
 * - below one second: milliseconds
 * - below one minute: seconds with three decimals
 * - below one hour: minutes and seconds
 * - otherwise: hours and minutes
 */
TEST(UtilsTest, FormatsDurationCorrectly) {
    EXPECT_EQ(formatDuration(0.0), "0 ms");
    EXPECT_EQ(formatDuration(0.032), "32 ms");
    EXPECT_EQ(formatDuration(0.8), "800 ms");
    EXPECT_EQ(formatDuration(3.21), "3.210 s");
    EXPECT_EQ(formatDuration(75), "1 m 15 s");
    EXPECT_EQ(formatDuration(3700), "1 h 1 m");
}

/**
 * @test RoundingCarriesIntoNextUnit
 * @brief Values just below a unit boundary never show "60 s" or "60.000 s"
 */
TEST(UtilsTest, RoundingCarriesIntoNextUnit) {
    EXPECT_EQ(formatDuration(0.9996), "1.000 s");
    EXPECT_EQ(formatDuration(59.9996), "1 m 0 s");
    EXPECT_EQ(formatDuration(59.9994), "59.999 s");
    EXPECT_EQ(formatDuration(119.6), "2 m 0 s");
    EXPECT_EQ(formatDuration(3599.6), "1 h 0 m");
}
