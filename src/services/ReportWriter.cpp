#include "services/ReportWriter.hpp"

#include "util/Logger.hpp"

#include <ctime>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr auto COMPONENT = "ReportWriter";
const std::string SEPARATOR(80, '-');

}  // namespace

auto ReportWriter::report_path(const Parameters& params) -> fs::path {
    return params.destination / params.image_name / (params.image_name + ".txt");
}

auto ReportWriter::format_time(std::chrono::system_clock::time_point time) -> std::string {
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

auto ReportWriter::render(const Report& report) -> std::vector<std::string> {
    const auto& params = report.parameters;

    std::vector<std::string> lines{
        TITLE,
        "Acquisition log",
        SEPARATOR,
        std::format("Case name: {}", params.case_name),
        std::format("Examiner: {}", params.examiner),
        std::format("Notes: {}", params.notes),
        SEPARATOR,
        std::format("Start time: {}", format_time(report.start_time)),
        std::format("End time: {}", format_time(report.end_time)),
        std::format("Source: {}", params.source.string()),
        std::format("Acquisition method: {}", report.method_name),
        SEPARATOR,
        report.hardware_info,
        SEPARATOR,
        report.path_details.disk_info,
        SEPARATOR,
        "Generated files:",
    };

    for (const auto& file : report.output_files()) {
        lines.push_back(std::format("    - {}", file.string()));
    }

    lines.push_back(SEPARATOR);
    if (report.result) {
        lines.push_back(std::format("Computed hashes ({}):", report.result->path.string()));
        lines.push_back(std::format("    - MD5: {}", report.result->md5));
        lines.push_back(std::format("    - SHA1: {}", report.result->sha1));
        lines.push_back(std::format("    - SHA256: {}", report.result->sha256));
    } else {
        lines.emplace_back("Computed hashes (none):");
    }

    return lines;
}

auto ReportWriter::write(const Report& report) -> std::expected<fs::path, util::Error> {
    const auto path = report_path(report.parameters);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        auto message = std::format("Cannot create {}: {}", path.parent_path().string(),
                                   ec.message());
        LOG_ERROR(COMPONENT, message);
        return std::unexpected(util::Error{util::ErrorKind::IO_FAILURE, std::move(message),
                                           ec.value()});
    }

    std::cout << "\nWriting report file " << path.string() << std::endl;

    std::ofstream output{path, std::ios::trunc};
    for (const auto& line : render(report)) {
        output << line << '\n';
    }
    output.flush();

    if (!output) {
        auto message = std::format("Failed writing {}", path.string());
        LOG_ERROR(COMPONENT, message);
        return std::unexpected(util::Error{util::ErrorKind::IO_FAILURE, std::move(message)});
    }

    LOG_INFO(COMPONENT, std::format("Report written to {}", path.string()));
    return path;
}
