/**
 * @file ToolOutputParserTest.cpp
 * @brief Unit tests for parsing disk and image tool output
 */

#include "services/ToolOutputParser.hpp"

#include <gtest/gtest.h>

// ========== parse_volume_device Tests ==========

TEST(ToolOutputParserTest, ParseVolumeDevice_TypicalInfoOutput_ReturnsIdentifier) {
    const std::string output =
        "\n"
        "   Device Identifier:         disk3s5\n"
        "   Device Node:               /dev/disk3s5\n"
        "   Whole:                     No\n";

    auto device = tool_output::parse_volume_device(output);

    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(*device, "disk3s5");
}

TEST(ToolOutputParserTest, ParseVolumeDevice_ValueWithColon_StopsAtSecondColon) {
    auto device = tool_output::parse_volume_device("header\nKey: value: extra\n");

    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(*device, "value");
}

TEST(ToolOutputParserTest, ParseVolumeDevice_SingleLine_ReturnsParseFailure) {
    auto device = tool_output::parse_volume_device("Could not find disk: /nowhere");

    ASSERT_FALSE(device.has_value());
    EXPECT_EQ(device.error().kind, util::ErrorKind::PARSE_FAILURE);
}

TEST(ToolOutputParserTest, ParseVolumeDevice_NoColon_ReturnsParseFailure) {
    auto device = tool_output::parse_volume_device("\nno separator here\n");

    ASSERT_FALSE(device.has_value());
    EXPECT_EQ(device.error().kind, util::ErrorKind::PARSE_FAILURE);
}

// ========== parse_attach_identifier Tests ==========

TEST(ToolOutputParserTest, ParseAttachIdentifier_ReturnsFirstToken) {
    const std::string output =
        "/dev/disk5          \tGUID_partition_scheme          \t\n"
        "/dev/disk5s1        \tApple_HFS                      \t/Volumes/CASE\n";

    auto volume = tool_output::parse_attach_identifier(output);

    ASSERT_TRUE(volume.has_value());
    EXPECT_EQ(*volume, "/dev/disk5");
}

TEST(ToolOutputParserTest, ParseAttachIdentifier_LeadingWhitespace_Ignored) {
    auto volume = tool_output::parse_attach_identifier("  \n /dev/disk9\n");

    ASSERT_TRUE(volume.has_value());
    EXPECT_EQ(*volume, "/dev/disk9");
}

TEST(ToolOutputParserTest, ParseAttachIdentifier_EmptyOutput_ReturnsParseFailure) {
    auto volume = tool_output::parse_attach_identifier(" \n\t");

    ASSERT_FALSE(volume.has_value());
    EXPECT_EQ(volume.error().kind, util::ErrorKind::PARSE_FAILURE);
}

// ========== parse_mount_point Tests ==========

TEST(ToolOutputParserTest, ParseMountPoint_FindsLineWithMarker) {
    const std::string output =
        "/dev/disk4          \tGUID_partition_scheme          \t\n"
        "/dev/disk4s1        \tApple_APFS                     \t\n"
        "/dev/disk5s1        \t41504653-0000-11AA-AA11-0030654\t/Volumes/Macintosh HD\n";

    auto mounted = tool_output::parse_mount_point(output, "/Volumes");

    ASSERT_TRUE(mounted.has_value());
    EXPECT_EQ(mounted->device, "/dev/disk5s1");
    EXPECT_EQ(mounted->mount_point, std::filesystem::path{"/Volumes/Macintosh HD"});
}

TEST(ToolOutputParserTest, ParseMountPoint_TrailingWhitespace_Trimmed) {
    auto mounted = tool_output::parse_mount_point("/dev/disk2s1 Apple_HFS /Volumes/Snap  \n",
                                                  "/Volumes");

    ASSERT_TRUE(mounted.has_value());
    EXPECT_EQ(mounted->mount_point, std::filesystem::path{"/Volumes/Snap"});
}

TEST(ToolOutputParserTest, ParseMountPoint_NoMarker_ReturnsParseFailure) {
    auto mounted = tool_output::parse_mount_point("/dev/disk4\tGUID_partition_scheme\n",
                                                  "/Volumes");

    ASSERT_FALSE(mounted.has_value());
    EXPECT_EQ(mounted.error().kind, util::ErrorKind::PARSE_FAILURE);
    EXPECT_EQ(mounted.error().message, "No mounted volume found in the output");
}

TEST(ToolOutputParserTest, ParseMountPoint_TooFewFields_ReturnsParseFailure) {
    auto mounted = tool_output::parse_mount_point("/Volumes/Only\n", "/Volumes");

    ASSERT_FALSE(mounted.has_value());
    EXPECT_EQ(mounted.error().kind, util::ErrorKind::PARSE_FAILURE);
}

TEST(ToolOutputParserTest, ParseMountPoint_CustomMarker) {
    auto mounted = tool_output::parse_mount_point("/dev/loop0 ext4 /mnt/fuji/snap\n", "/mnt");

    ASSERT_TRUE(mounted.has_value());
    EXPECT_EQ(mounted->mount_point, std::filesystem::path{"/mnt/fuji/snap"});
}

// ========== trim Tests ==========

TEST(ToolOutputParserTest, Trim_RemovesSurroundingWhitespace) {
    EXPECT_EQ(tool_output::trim("\t disk1 \r\n"), "disk1");
    EXPECT_EQ(tool_output::trim("   "), "");
}
