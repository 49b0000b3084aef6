/**
 * @file AcquisitionTypes.hpp
 * @brief Data types shared by acquisition strategies
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @struct Parameters
 * @brief Caller-supplied description of one acquisition
 */
struct Parameters {
    std::string case_name;
    std::string examiner;
    std::string notes;
    std::string image_name = "FujiAcquisition";
    std::filesystem::path source = "/";
    std::filesystem::path tmp = "/Volumes/Fuji";          ///< Temporary working area
    std::filesystem::path destination = "/Volumes/Fuji";  ///< Where images and the report go

    auto operator==(const Parameters&) const -> bool = default;
};

/**
 * @struct PathDetails
 * @brief Volume information for the acquisition source
 *
 * An empty disk_device means geometry is unknown.
 */
struct PathDetails {
    std::filesystem::path path;
    bool is_disk = false;          ///< Path is itself a mount boundary
    uint64_t disk_sectors = 0;     ///< blocks * block_size / 512
    std::string disk_device;       ///< Device identifier reported by the volume-info tool
    uint64_t disk_identifier = 0;  ///< st_dev of the path
    std::string disk_info;         ///< Raw volume-info output

    auto operator==(const PathDetails&) const -> bool = default;
};

/**
 * @struct HashedFile
 * @brief Digests of one file, all computed from a single read pass
 */
struct HashedFile {
    std::filesystem::path path;
    std::string md5;
    std::string sha1;
    std::string sha256;

    auto operator==(const HashedFile&) const -> bool = default;
};

/**
 * @struct Report
 * @brief Everything known about one acquisition run
 *
 * Created at strategy entry with success = false and filled in as steps
 * complete. output_files is append-only and keeps creation order.
 */
struct Report {
    using Clock = std::chrono::system_clock;

    Report(Parameters params, std::string method)
        : parameters(std::move(params)), method_name(std::move(method)) {}

    Parameters parameters;
    std::string method_name;
    Clock::time_point start_time{};
    Clock::time_point end_time{};
    PathDetails path_details;
    std::string hardware_info;
    bool success = false;
    std::optional<HashedFile> result;

    void add_output_file(std::filesystem::path file) {
        output_files_.push_back(std::move(file));
    }

    [[nodiscard]] auto output_files() const -> const std::vector<std::filesystem::path>& {
        return output_files_;
    }

private:
    std::vector<std::filesystem::path> output_files_;
};

/**
 * @struct ProcessResult
 * @brief Exit status and accumulated output of a finished child process
 */
struct ProcessResult {
    int exit_code = -1;
    std::string output;

    [[nodiscard]] auto succeeded() const -> bool { return exit_code == 0; }
};

/**
 * @struct MountedVolume
 * @brief A volume attached from a disk image
 */
struct MountedVolume {
    std::string device;                ///< Identifier passed to the detach command
    std::filesystem::path mount_point;

    auto operator==(const MountedVolume&) const -> bool = default;
};

/**
 * @struct TemporaryImage
 * @brief A growable image created in the working area and its attached volume
 */
struct TemporaryImage {
    std::filesystem::path image_path;
    std::string volume;
};

/**
 * @struct DetachPolicy
 * @brief Retry schedule for detaching a volume
 */
struct DetachPolicy {
    std::chrono::seconds delay{30};
    std::chrono::seconds interval{10};
    int max_attempts = 3;
};
