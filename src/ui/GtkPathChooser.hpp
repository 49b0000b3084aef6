/**
 * @file GtkPathChooser.hpp
 * @brief Native file/folder dialogs for the interactive acquisition steps
 */

#pragma once

#include "interfaces/IPathChooser.hpp"

#include <gtk/gtk.h>

/**
 * @class GtkPathChooser
 * @brief IPathChooser backed by GtkFileChooserNative
 *
 * Each call shows a modal native dialog and spins a private GMainLoop until
 * the operator answers. Without a usable display every call behaves as a
 * cancellation.
 */
class GtkPathChooser : public IPathChooser {
public:
    GtkPathChooser() = default;
    ~GtkPathChooser() override = default;

    GtkPathChooser(const GtkPathChooser&) = delete;
    GtkPathChooser& operator=(const GtkPathChooser&) = delete;

    [[nodiscard]] auto choose_file(const std::string& prompt,
                                   const std::vector<std::string>& extensions)
        -> std::optional<std::filesystem::path> override;

    [[nodiscard]] auto choose_directory(const std::string& prompt)
        -> std::optional<std::filesystem::path> override;

private:
    [[nodiscard]] auto ensure_initialized() -> bool;

    [[nodiscard]] auto run_dialog(GtkFileChooserAction action, const std::string& prompt,
                                  const std::vector<std::string>& extensions)
        -> std::optional<std::filesystem::path>;

    bool initialized_ = false;
    bool available_ = false;
};
