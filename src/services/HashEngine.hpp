/**
 * @file HashEngine.hpp
 * @brief Single-pass MD5 / SHA-1 / SHA-256 file hashing
 */

#pragma once

#include "models/AcquisitionTypes.hpp"
#include "util/Error.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <iostream>
#include <ostream>

/**
 * @class HashEngine
 * @brief Streams a file once through three GLib checksums
 *
 * Progress is printed as "N% " markers, each whole percentage at most once
 * and in increasing order, with a line break after every multiple of 20.
 */
class HashEngine {
public:
    static constexpr std::size_t CHUNK_SIZE = 16 * 1024;

    /**
     * @param progress Stream receiving the progress markers
     */
    explicit HashEngine(std::ostream& progress = std::cout);

    /**
     * @brief Hash a regular file
     * @param path File to hash
     * @return Lowercase hexadecimal digests, or IO_FAILURE
     */
    [[nodiscard]] auto hash(const std::filesystem::path& path)
        -> std::expected<HashedFile, util::Error>;

private:
    void report_progress(uint64_t done, uint64_t total, int& last_percent);

    std::ostream& progress_;
};
