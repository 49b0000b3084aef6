/**
 * @file DiskInspector.hpp
 * @brief Resolves a path to its volume and gathers geometry and host details
 */

#pragma once

#include "interfaces/IDiskInspector.hpp"
#include "interfaces/IFileSystem.hpp"
#include "interfaces/IProcessRunner.hpp"
#include "models/ToolCommands.hpp"

/**
 * @class DiskInspector
 * @brief IDiskInspector backed by the volume-info and hardware profiler tools
 *
 * Geometry always comes from the file system holding the requested path.
 * The device identifier and description come from the path itself when it
 * is a mount point, otherwise from the nearest mounted ancestor.
 */
class DiskInspector : public IDiskInspector {
public:
    DiskInspector(IProcessRunner& runner, IFileSystem& file_system, const ToolCommands& tools);
    ~DiskInspector() override = default;

    DiskInspector(const DiskInspector&) = delete;
    DiskInspector& operator=(const DiskInspector&) = delete;

    [[nodiscard]] auto describe(const std::filesystem::path& path) -> PathDetails override;
    [[nodiscard]] auto hardware_description() -> std::string override;

    /**
     * @brief Walk up from a path until a mount point is reached
     * @param path Resolved path
     * @return The path itself if it is a mount point, else its closest mounted ancestor
     */
    [[nodiscard]] auto find_mount_point(const std::filesystem::path& path)
        -> std::filesystem::path;

private:
    IProcessRunner& runner_;
    IFileSystem& file_system_;
    const ToolCommands& tools_;
};
