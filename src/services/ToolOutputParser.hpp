/**
 * @file ToolOutputParser.hpp
 * @brief Parsers for the text output of the external disk image tools
 *
 * Each function owns exactly one positional assumption about one tool's
 * output. They never touch the tools themselves.
 */

#pragma once

#include "models/AcquisitionTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace tool_output {

/**
 * @brief Extract the device identifier from volume-info output
 * @param output Full output of the volume-info command
 * @return Value of the "key: value" pair on line index 1, trimmed
 *
 * Fails with PARSE_FAILURE when the output has fewer than two lines or the
 * second line holds no colon.
 */
[[nodiscard]] auto parse_volume_device(std::string_view output)
    -> std::expected<std::string, util::Error>;

/**
 * @brief Extract the attached volume identifier from attach output
 * @param output Full output of the attach command
 * @return First whitespace-delimited token
 */
[[nodiscard]] auto parse_attach_identifier(std::string_view output)
    -> std::expected<std::string, util::Error>;

/**
 * @brief Find where an attached image was mounted
 * @param output Full output of the attach command
 * @param mount_root_marker Text identifying the line with the mount point
 * @return Device (first field) and mount point (third field) of the first
 *         matching line, split into at most three whitespace-delimited fields
 */
[[nodiscard]] auto parse_mount_point(std::string_view output, std::string_view mount_root_marker)
    -> std::expected<MountedVolume, util::Error>;

/**
 * @brief Trim leading and trailing whitespace
 */
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

}  // namespace tool_output
