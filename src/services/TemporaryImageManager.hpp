/**
 * @file TemporaryImageManager.hpp
 * @brief Lifecycle of the growable working image used during acquisition
 */

#pragma once

#include "interfaces/IProcessRunner.hpp"
#include "models/AcquisitionTypes.hpp"
#include "models/ToolCommands.hpp"
#include "services/DetachSupervisor.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

/**
 * @class TemporaryImageManager
 * @brief Creates, attaches, converts and releases the working image
 *
 * Produced paths are appended to the report as soon as they exist on disk,
 * so a partially completed run still lists everything it left behind.
 */
class TemporaryImageManager {
public:
    TemporaryImageManager(IProcessRunner& runner, DetachSupervisor& supervisor,
                          const ToolCommands& tools);

    TemporaryImageManager(const TemporaryImageManager&) = delete;
    TemporaryImageManager& operator=(const TemporaryImageManager&) = delete;

    /**
     * @brief Create a sparse image of the given size and attach it writable
     * @param sectors Image size in 512-byte sectors
     * @param image_name Volume name and file stem
     * @param working_dir Root of the temporary working area
     * @param report Receives the image path once it is attached
     * @return Image path and attached volume identifier
     */
    [[nodiscard]] auto create_and_attach(uint64_t sectors, const std::string& image_name,
                                         const std::filesystem::path& working_dir,
                                         Report& report)
        -> std::expected<TemporaryImage, util::Error>;

    /**
     * @brief Convert a working image into a compressed read-only image
     * @param image_path Source image (must be detached)
     * @param image_name File stem of the output
     * @param destination_dir Root of the output area
     * @param report Receives the output path on success
     * @return Path of the compressed image
     */
    [[nodiscard]] auto convert(const std::filesystem::path& image_path,
                               const std::string& image_name,
                               const std::filesystem::path& destination_dir, Report& report)
        -> std::expected<std::filesystem::path, util::Error>;

    /**
     * @brief Release the attached working volume
     * @return false if every attempt of the policy failed
     */
    [[nodiscard]] auto detach(const TemporaryImage& image, const DetachPolicy& policy = {})
        -> bool;

private:
    IProcessRunner& runner_;
    DetachSupervisor& supervisor_;
    const ToolCommands& tools_;
};
