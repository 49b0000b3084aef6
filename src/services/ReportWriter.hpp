/**
 * @file ReportWriter.hpp
 * @brief Plain-text acquisition log
 */

#pragma once

#include "models/AcquisitionTypes.hpp"
#include "util/Error.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @class ReportWriter
 * @brief Renders and writes the plain-text acquisition log
 *
 * The layout is fixed: header, case details, timing, hardware description,
 * volume information, generated files and computed hashes, separated by
 * 80-dash lines.
 */
class ReportWriter {
public:
    static constexpr auto TITLE = "Fuji - Forensic Unattended Juicy Imaging";

    /**
     * @brief Location of the report for a set of parameters
     * @return <destination>/<image_name>/<image_name>.txt
     */
    [[nodiscard]] static auto report_path(const Parameters& params) -> std::filesystem::path;

    /**
     * @brief Render the report as its fixed sequence of lines
     */
    [[nodiscard]] static auto render(const Report& report) -> std::vector<std::string>;

    /**
     * @brief Write the report, replacing any previous one
     * @return Path of the written file, or IO_FAILURE
     */
    [[nodiscard]] auto write(const Report& report) -> std::expected<std::filesystem::path, util::Error>;

    /**
     * @brief Local time as "YYYY-MM-DD HH:MM:SS"
     */
    [[nodiscard]] static auto format_time(std::chrono::system_clock::time_point time)
        -> std::string;
};
