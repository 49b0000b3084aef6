/**
 * @file IPathChooser.hpp
 * @brief Interface for asking the operator for a file or a folder
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @class IPathChooser
 * @brief Abstract interactive chooser
 *
 * std::nullopt means the operator cancelled the selection.
 */
class IPathChooser {
public:
    virtual ~IPathChooser() = default;

    /**
     * @brief Ask for an existing file
     * @param prompt Title shown to the operator
     * @param extensions Accepted file extensions, without the leading dot
     * @return Absolute path of the selected file, or nullopt if cancelled
     */
    [[nodiscard]] virtual auto choose_file(const std::string& prompt,
                                           const std::vector<std::string>& extensions)
        -> std::optional<std::filesystem::path> = 0;

    /**
     * @brief Ask for a directory
     * @param prompt Title shown to the operator
     * @return Absolute path of the selected directory, or nullopt if cancelled
     */
    [[nodiscard]] virtual auto choose_directory(const std::string& prompt)
        -> std::optional<std::filesystem::path> = 0;
};
