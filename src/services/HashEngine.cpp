#include "services/HashEngine.hpp"

#include "util/Logger.hpp"

#include <glib.h>

#include <array>
#include <format>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr auto COMPONENT = "HashEngine";

struct ChecksumDeleter {
    void operator()(GChecksum* checksum) const noexcept { g_checksum_free(checksum); }
};

using Checksum = std::unique_ptr<GChecksum, ChecksumDeleter>;

auto io_error(std::string message, int code = 0) -> std::unexpected<util::Error> {
    LOG_ERROR(COMPONENT, message);
    return std::unexpected(util::Error{util::ErrorKind::IO_FAILURE, std::move(message), code});
}

}  // namespace

HashEngine::HashEngine(std::ostream& progress) : progress_(progress) {}

void HashEngine::report_progress(uint64_t done, uint64_t total, int& last_percent) {
    const auto percent = static_cast<int>(total == 0 ? 100 : done * 100 / total);
    if (percent <= last_percent) {
        return;
    }

    progress_ << percent << "% ";
    if (percent % 20 == 0) {
        progress_ << '\n';
    }
    progress_.flush();
    last_percent = percent;
}

auto HashEngine::hash(const fs::path& path) -> std::expected<HashedFile, util::Error> {
    progress_ << "\nHashing " << path.string() << std::endl;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return io_error(std::format("{} is not a regular file", path.string()), ec.value());
    }
    const auto total = static_cast<uint64_t>(fs::file_size(path, ec));
    if (ec) {
        return io_error(std::format("Cannot size {}: {}", path.string(), ec.message()),
                        ec.value());
    }

    std::ifstream file{path, std::ios::binary};
    if (!file) {
        return io_error(std::format("Cannot open {}", path.string()));
    }

    Checksum md5{g_checksum_new(G_CHECKSUM_MD5)};
    Checksum sha1{g_checksum_new(G_CHECKSUM_SHA1)};
    Checksum sha256{g_checksum_new(G_CHECKSUM_SHA256)};

    std::array<char, CHUNK_SIZE> buffer{};
    uint64_t done = 0;
    int last_percent = 0;

    if (total == 0) {
        report_progress(0, 0, last_percent);
    }

    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = file.gcount();
        if (count <= 0) {
            break;
        }

        const auto* data = reinterpret_cast<const guchar*>(buffer.data());
        g_checksum_update(md5.get(), data, count);
        g_checksum_update(sha1.get(), data, count);
        g_checksum_update(sha256.get(), data, count);

        done += static_cast<uint64_t>(count);
        report_progress(done, total, last_percent);
    }

    if (file.bad()) {
        return io_error(std::format("Read error in {} after {} bytes", path.string(), done));
    }

    progress_ << "Hashing completed" << std::endl;

    HashedFile hashed{.path = path,
                      .md5 = g_checksum_get_string(md5.get()),
                      .sha1 = g_checksum_get_string(sha1.get()),
                      .sha256 = g_checksum_get_string(sha256.get())};

    LOG_INFO(COMPONENT, std::format("{} ({} bytes) sha256={}", path.string(), done, hashed.sha256));
    return hashed;
}
