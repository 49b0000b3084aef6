/**
 * @file IFileSystem.hpp
 * @brief Interface for the file system queries used by volume inspection
 */

#pragma once

#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>

/**
 * @struct VolumeStats
 * @brief Block geometry of the file system holding a path
 */
struct VolumeStats {
    uint64_t blocks = 0;      ///< Total blocks (f_blocks)
    uint64_t block_size = 0;  ///< Fragment size (f_frsize)
};

/**
 * @class IFileSystem
 * @brief Abstract interface over path resolution and volume statistics
 */
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    /**
     * @brief Resolve symbolic links and relative components
     * @return Canonical path, or the input made absolute if it cannot be resolved
     */
    [[nodiscard]] virtual auto resolve(const std::filesystem::path& path)
        -> std::filesystem::path = 0;

    /**
     * @brief Check whether a path is the root of a mounted file system
     */
    [[nodiscard]] virtual auto is_mount_point(const std::filesystem::path& path) -> bool = 0;

    [[nodiscard]] virtual auto volume_stats(const std::filesystem::path& path)
        -> std::expected<VolumeStats, util::Error> = 0;

    /**
     * @brief Device id (st_dev) of the file system holding a path
     */
    [[nodiscard]] virtual auto device_id(const std::filesystem::path& path)
        -> std::expected<uint64_t, util::Error> = 0;
};
