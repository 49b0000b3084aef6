#include "acquisition/SnapshotMountStrategy.hpp"

#include "acquisition/MountGuard.hpp"
#include "services/ToolOutputParser.hpp"
#include "util/Logger.hpp"

#include <format>
#include <iostream>

namespace fs = std::filesystem;

namespace {

constexpr auto COMPONENT = "SnapshotMount";

// Operator-facing message plus the matching log entry
void abort_with(const util::Error& error, std::string_view message) {
    std::cout << message << std::endl;
    if (error.kind == util::ErrorKind::USER_CANCELLED) {
        LOG_INFO(COMPONENT, message);
    } else {
        LOG_ERROR(COMPONENT, std::format("{} [{}] {}", message, util::kind_name(error.kind),
                                         error.message));
    }
}

void warn_detach_failed(const acquisition::MountGuard& guard) {
    std::cout << "Warning: Failed to detach the mounted image. You may need to detach "
              << guard.target() << " manually." << std::endl;
    LOG_WARNING(COMPONENT, std::format("[{}] {} is still attached at {}",
                                       util::kind_name(util::ErrorKind::DETACH_WARNING),
                                       guard.target(), guard.volume().mount_point.string()));
}

}  // namespace

SnapshotMountStrategy::SnapshotMountStrategy(AcquisitionServices& services)
    : AcquisitionStrategy(services) {}

auto SnapshotMountStrategy::execute(const Parameters& params) -> Report {
    auto report = begin_report(params);
    LOG_INFO(COMPONENT, std::format("Acquisition '{}' started for case '{}'", params.image_name,
                                    params.case_name));

    std::cout << "Preparing to mount a snapshot image...\n" << std::endl;
    const auto image = services_.chooser.choose_file("Select a snapshot image to mount:",
                                                     services_.tools.snapshot_extensions);
    if (!image) {
        abort_with(util::Error{util::ErrorKind::USER_CANCELLED, "No image selected"},
                   "No snapshot image was selected. Aborting.");
        return report;
    }

    auto mounted = mount_snapshot(*image);
    if (!mounted) {
        abort_with(mounted.error(), "Failed to mount the snapshot image. Aborting.");
        return report;
    }
    acquisition::MountGuard guard{services_.supervisor, *mounted, services_.detach_policy};

    std::cout << "Please select a destination for the copied files..." << std::endl;
    const auto destination =
        services_.chooser.choose_directory("Select a destination folder for the copied files:");
    if (!destination) {
        abort_with(util::Error{util::ErrorKind::USER_CANCELLED, "No destination selected"},
                   "No destination was selected. Detaching mounted image and aborting.");
        if (!guard.detach()) {
            warn_detach_failed(guard);
        }
        return report;
    }

    const auto copied = copy_with_clone(mounted->mount_point, *destination);

    if (!guard.detach()) {
        warn_detach_failed(guard);
    }

    if (!copied) {
        report.end_time = Report::Clock::now();
        abort_with(copied.error(), "Copy failed; no report will be written.");
        return report;
    }

    report.add_output_file(*destination);

    // The detached image is stable now; its digest authenticates what was copied
    auto hashed = services_.hash_engine.hash(*image);
    report.end_time = Report::Clock::now();
    if (!hashed) {
        abort_with(hashed.error(), "Failed to hash the snapshot image; no report will be written.");
        return report;
    }
    report.result = std::move(*hashed);
    report.success = true;

    if (auto written = services_.report_writer.write(report); !written) {
        report.success = false;
        abort_with(written.error(), "Failed to write the report file.");
        return report;
    }

    std::cout << "\nAcquisition completed!" << std::endl;
    LOG_INFO(COMPONENT, std::format("Acquisition '{}' completed", params.image_name));
    return report;
}

auto SnapshotMountStrategy::mount_snapshot(const fs::path& image)
    -> std::expected<MountedVolume, util::Error> {
    std::cout << "Mounting image: " << image.string() << std::endl;

    auto result = services_.runner.run_streamed(
        {services_.tools.image_tool, "attach", image.string()}, true, std::nullopt);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        std::cout << "Failed to mount image with error code " << result->exit_code << std::endl;
        return std::unexpected(util::Error{util::ErrorKind::PROCESS_EXIT_FAILURE,
                                           std::format("attach exited with {}", result->exit_code),
                                           result->exit_code});
    }

    auto mounted = tool_output::parse_mount_point(result->output, services_.tools.mount_root_marker);
    if (!mounted) {
        std::cout << mounted.error().message << std::endl;
        // Attach succeeded, so something is attached even without a mount point
        if (auto attached = tool_output::parse_attach_identifier(result->output)) {
            if (!services_.supervisor.detach(*attached, services_.detach_policy)) {
                std::cout << "Warning: Failed to detach the attached image. You may need to "
                          << "detach " << *attached << " manually." << std::endl;
                LOG_WARNING(COMPONENT,
                            std::format("[{}] {} is still attached",
                                        util::kind_name(util::ErrorKind::DETACH_WARNING),
                                        *attached));
            }
        }
        return mounted;
    }

    std::cout << "Image mounted at: " << mounted->mount_point.string() << std::endl;
    LOG_INFO(COMPONENT, std::format("{} mounted at {} ({})", image.string(),
                                    mounted->mount_point.string(), mounted->device));
    return mounted;
}

auto SnapshotMountStrategy::copy_with_clone(const fs::path& source, const fs::path& destination)
    -> std::expected<void, util::Error> {
    std::cout << "Copying files from " << source.string() << " to " << destination.string()
              << " with cloning..." << std::endl;

    const auto log_file = destination / COPY_LOG_NAME;
    auto args = services_.tools.clone_copy;
    args.push_back(source.string());
    args.push_back(destination.string());

    auto result = services_.runner.run_streamed(args, true, log_file);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        std::cout << "Failed to copy files with error code " << result->exit_code << std::endl;
        return std::unexpected(util::Error{util::ErrorKind::PROCESS_EXIT_FAILURE,
                                           std::format("copy exited with {}", result->exit_code),
                                           result->exit_code});
    }

    std::cout << "Successfully copied files to " << destination.string() << "\n"
              << "Log file created at " << log_file.string() << std::endl;
    return {};
}
