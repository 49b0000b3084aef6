#include "services/ToolOutputParser.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace tool_output {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\v\f";

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    while (!text.empty()) {
        const auto end = text.find('\n');
        auto line = text.substr(0, end);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (end == std::string_view::npos) {
            break;
        }
        text.remove_prefix(end + 1);
    }
    return lines;
}

auto parse_error(std::string message) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::PARSE_FAILURE, std::move(message)});
}

}  // namespace

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

auto parse_volume_device(std::string_view output) -> std::expected<std::string, util::Error> {
    const auto lines = split_lines(output);
    if (lines.size() < 2) {
        return parse_error("Volume info output has no device line");
    }

    // Line 0 is blank or a header; line 1 is "Device Identifier:   diskNsM"
    const auto line = lines[1];
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return parse_error(std::format("No key/value pair in '{}'", line));
    }

    auto value = line.substr(colon + 1);
    value = value.substr(0, value.find(':'));
    return std::string{trim(value)};
}

auto parse_attach_identifier(std::string_view output) -> std::expected<std::string, util::Error> {
    const auto text = trim(output);
    if (text.empty()) {
        return parse_error("Attach produced no output");
    }
    return std::string{text.substr(0, text.find_first_of(WHITESPACE))};
}

auto parse_mount_point(std::string_view output, std::string_view mount_root_marker)
    -> std::expected<MountedVolume, util::Error> {
    for (auto line : split_lines(trim(output))) {
        if (line.find(mount_root_marker) == std::string_view::npos) {
            continue;
        }

        // device <ws> content-hint <ws> mount point (may contain spaces)
        std::string_view fields[2];
        std::string_view rest = line;
        int count = 0;
        while (count < 2 && !rest.empty()) {
            const auto end = rest.find_first_of(WHITESPACE);
            fields[count++] = rest.substr(0, end);
            if (end == std::string_view::npos) {
                rest = {};
                break;
            }
            rest.remove_prefix(end);
            rest.remove_prefix(std::min(rest.size(), rest.find_first_not_of(WHITESPACE)));
        }

        const auto mount_point = trim(rest);
        if (count < 2 || mount_point.empty()) {
            return parse_error(std::format("Failed to parse mount point from: {}", line));
        }
        return MountedVolume{.device = std::string{fields[0]},
                             .mount_point = std::filesystem::path{std::string{mount_point}}};
    }

    return parse_error("No mounted volume found in the output");
}

}  // namespace tool_output
