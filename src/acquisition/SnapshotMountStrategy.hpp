/**
 * @file SnapshotMountStrategy.hpp
 * @brief Acquisition by mounting a snapshot image and clone-copying its contents
 */

#pragma once

#include "acquisition/AcquisitionStrategy.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>

/**
 * @class SnapshotMountStrategy
 * @brief Interactive snapshot-mount acquisition
 *
 * Steps: choose a snapshot image, attach it, choose a destination, copy the
 * mounted tree with clone semantics, detach, hash the snapshot image and
 * write the report. Once the image is mounted every exit path detaches it.
 */
class SnapshotMountStrategy : public AcquisitionStrategy {
public:
    static constexpr auto IDENTIFIER = "snapshot";
    static constexpr auto COPY_LOG_NAME = "clone_copy.log";

    explicit SnapshotMountStrategy(AcquisitionServices& services);

    [[nodiscard]] auto execute(const Parameters& params) -> Report override;

    [[nodiscard]] auto get_name() const -> std::string override { return "Snapshot Mount"; }

    [[nodiscard]] auto get_description() const -> std::string override {
        return "Mount an image containing a snapshot and copy its contents to a destination "
               "using a clone-capable copy";
    }

    /**
     * @brief Attach a snapshot image and locate its mount point
     * @param image Snapshot image file
     * @return Device and mount point, PROCESS_EXIT_FAILURE or PARSE_FAILURE
     *
     * On PARSE_FAILURE the image was attached anyway and has already been
     * detached by the time this returns.
     */
    [[nodiscard]] auto mount_snapshot(const std::filesystem::path& image)
        -> std::expected<MountedVolume, util::Error>;

    /**
     * @brief Clone-copy a mounted tree into a destination, keeping its top-level name
     * @param source Mount point to copy from
     * @param destination Directory that receives the copy and its log file
     */
    [[nodiscard]] auto copy_with_clone(const std::filesystem::path& source,
                                       const std::filesystem::path& destination)
        -> std::expected<void, util::Error>;
};
