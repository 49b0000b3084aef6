#include "services/SystemFileSystem.hpp"

#include <sys/stat.h>
#include <sys/statvfs.h>

#include <cerrno>
#include <cstring>
#include <format>

namespace fs = std::filesystem;

namespace {

auto errno_error(std::string_view call, const fs::path& path, int err) -> util::Error {
    return util::Error{util::ErrorKind::IO_FAILURE,
                       std::format("{}({}) failed: {}", call, path.string(), std::strerror(err)),
                       err};
}

}  // namespace

auto SystemFileSystem::resolve(const fs::path& path) -> fs::path {
    std::error_code ec;
    auto resolved = fs::canonical(path, ec);
    if (!ec) {
        return resolved;
    }
    resolved = fs::absolute(path, ec);
    return ec ? path : resolved.lexically_normal();
}

auto SystemFileSystem::is_mount_point(const fs::path& path) -> bool {
    struct stat self{};
    if (::lstat(path.c_str(), &self) != 0 || S_ISLNK(self.st_mode)) {
        return false;
    }

    const auto parent = path / "..";
    struct stat up{};
    if (::lstat(parent.c_str(), &up) != 0) {
        return false;
    }

    // A different device below the parent, or "/" where .. is the path itself
    return self.st_dev != up.st_dev || self.st_ino == up.st_ino;
}

auto SystemFileSystem::volume_stats(const fs::path& path)
    -> std::expected<VolumeStats, util::Error> {
    struct statvfs stats{};
    if (::statvfs(path.c_str(), &stats) != 0) {
        return std::unexpected(errno_error("statvfs", path, errno));
    }
    return VolumeStats{.blocks = static_cast<uint64_t>(stats.f_blocks),
                       .block_size = static_cast<uint64_t>(stats.f_frsize)};
}

auto SystemFileSystem::device_id(const fs::path& path) -> std::expected<uint64_t, util::Error> {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return std::unexpected(errno_error("stat", path, errno));
    }
    return static_cast<uint64_t>(st.st_dev);
}
