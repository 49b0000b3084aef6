/**
 * @file IDiskInspector.hpp
 * @brief Interface for describing the volume behind a path
 */

#pragma once

#include "models/AcquisitionTypes.hpp"

#include <filesystem>
#include <string>

/**
 * @class IDiskInspector
 * @brief Abstract interface for source volume and host inspection
 */
class IDiskInspector {
public:
    virtual ~IDiskInspector() = default;

    /**
     * @brief Describe the volume that holds a path
     * @param path Any path on the volume
     * @return Volume details; an empty disk_device means geometry is unknown
     */
    [[nodiscard]] virtual auto describe(const std::filesystem::path& path) -> PathDetails = 0;

    /**
     * @brief Free-text description of the host hardware
     * @return Hardware profiler output, empty if it could not be gathered
     */
    [[nodiscard]] virtual auto hardware_description() -> std::string = 0;
};
