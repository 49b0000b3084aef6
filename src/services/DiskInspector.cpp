#include "services/DiskInspector.hpp"

#include "services/ToolOutputParser.hpp"
#include "util/Logger.hpp"

#include <format>

namespace fs = std::filesystem;

namespace {

constexpr auto COMPONENT = "DiskInspector";
constexpr uint64_t BYTES_PER_SECTOR = 512;

}  // namespace

DiskInspector::DiskInspector(IProcessRunner& runner, IFileSystem& file_system,
                             const ToolCommands& tools)
    : runner_(runner), file_system_(file_system), tools_(tools) {}

auto DiskInspector::find_mount_point(const fs::path& path) -> fs::path {
    auto current = path;
    while (!file_system_.is_mount_point(current) && current != current.parent_path()) {
        current = current.parent_path();
    }
    return current;
}

auto DiskInspector::describe(const fs::path& path) -> PathDetails {
    PathDetails details{.path = path};

    const auto resolved = file_system_.resolve(path);
    details.is_disk = file_system_.is_mount_point(resolved);

    if (details.is_disk) {
        auto args = tools_.volume_info;
        args.push_back(resolved.string());

        auto info = runner_.run_captured(args, false);
        if (info && info->succeeded()) {
            if (auto device = tool_output::parse_volume_device(info->output)) {
                details.disk_device = std::move(*device);
                details.disk_info = std::move(info->output);
            } else {
                LOG_WARNING(COMPONENT, device.error().message);
                details.is_disk = false;
            }
        } else {
            LOG_WARNING(COMPONENT, std::format("No volume info for {}", resolved.string()));
            details.is_disk = false;
            // Keep the tool's own explanation for the report
            if (info) {
                details.disk_info = std::move(info->output);
            }
        }
    }

    if (!details.is_disk) {
        const auto mount_point = find_mount_point(resolved);
        // A mount point whose own query failed has nothing further to ask
        if (mount_point != resolved) {
            LOG_DEBUG(COMPONENT, std::format("{} lives on {}", path.string(),
                                             mount_point.string()));
            auto parent = describe(mount_point);
            details.disk_device = std::move(parent.disk_device);
            details.disk_info = std::move(parent.disk_info);
        }
    }

    if (auto stats = file_system_.volume_stats(path)) {
        details.disk_sectors = stats->blocks * stats->block_size / BYTES_PER_SECTOR;
    } else {
        LOG_WARNING(COMPONENT, stats.error().message);
        details.is_disk = false;
        details.disk_device.clear();
    }

    if (auto device_id = file_system_.device_id(path)) {
        details.disk_identifier = *device_id;
    }

    LOG_INFO(COMPONENT, std::format("{}: disk={} sectors={} device='{}'", path.string(),
                                    details.is_disk, details.disk_sectors, details.disk_device));
    return details;
}

auto DiskInspector::hardware_description() -> std::string {
    auto result = runner_.run_captured(tools_.hardware_profiler, false);
    if (!result) {
        LOG_WARNING(COMPONENT, result.error().message);
        return {};
    }
    if (!result->succeeded()) {
        LOG_WARNING(COMPONENT, std::format("Hardware profiler exited with {}", result->exit_code));
    }
    return std::move(result->output);
}
