/**
 * @file ToolCommands.hpp
 * @brief Command table for the external disk, image and copy tools
 */

#pragma once

#include <string>
#include <vector>

/**
 * @struct ToolCommands
 * @brief Names and fixed arguments of every external command the engine runs
 *
 * Defaults are the macOS tools the acquisition workflow was designed around.
 * Each entry is a command prefix; operands are appended at the call site.
 */
struct ToolCommands {
    std::vector<std::string> keep_awake{"caffeinate", "-dimsu"};
    std::vector<std::string> volume_info{"diskutil", "info"};
    std::vector<std::string> hardware_profiler{"system_profiler", "SPHardwareDataType"};
    std::vector<std::string> clone_copy{"ditto", "--clone", "--keepParent"};
    std::string image_tool = "hdiutil";
    std::string compressed_format = "UDZO";
    std::string mount_root_marker = "/Volumes";  ///< Prefix of mount points created by attach
    std::vector<std::string> snapshot_extensions{"dmg", "sparseimage"};
};
