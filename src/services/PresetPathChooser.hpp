/**
 * @file PresetPathChooser.hpp
 * @brief Non-interactive chooser for unattended acquisitions
 */

#pragma once

#include "interfaces/IPathChooser.hpp"

#include <utility>

/**
 * @class PresetPathChooser
 * @brief Answers chooser prompts from values given on the command line
 *
 * A prompt without a preset is forwarded to the fallback chooser, or treated
 * as cancelled when there is none.
 */
class PresetPathChooser : public IPathChooser {
public:
    PresetPathChooser(std::optional<std::filesystem::path> file,
                      std::optional<std::filesystem::path> directory,
                      IPathChooser* fallback = nullptr)
        : file_(std::move(file)), directory_(std::move(directory)), fallback_(fallback) {}

    [[nodiscard]] auto choose_file(const std::string& prompt,
                                   const std::vector<std::string>& extensions)
        -> std::optional<std::filesystem::path> override {
        if (file_) {
            return file_;
        }
        return fallback_ ? fallback_->choose_file(prompt, extensions) : std::nullopt;
    }

    [[nodiscard]] auto choose_directory(const std::string& prompt)
        -> std::optional<std::filesystem::path> override {
        if (directory_) {
            return directory_;
        }
        return fallback_ ? fallback_->choose_directory(prompt) : std::nullopt;
    }

private:
    std::optional<std::filesystem::path> file_;
    std::optional<std::filesystem::path> directory_;
    IPathChooser* fallback_;
};
