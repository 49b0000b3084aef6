/**
 * @file SystemFileSystem.hpp
 * @brief POSIX implementation of IFileSystem
 */

#pragma once

#include "interfaces/IFileSystem.hpp"

class SystemFileSystem : public IFileSystem {
public:
    [[nodiscard]] auto resolve(const std::filesystem::path& path)
        -> std::filesystem::path override;
    [[nodiscard]] auto is_mount_point(const std::filesystem::path& path) -> bool override;
    [[nodiscard]] auto volume_stats(const std::filesystem::path& path)
        -> std::expected<VolumeStats, util::Error> override;
    [[nodiscard]] auto device_id(const std::filesystem::path& path)
        -> std::expected<uint64_t, util::Error> override;
};
