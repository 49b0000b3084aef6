#include "ui/GtkPathChooser.hpp"

#include "util/Logger.hpp"

#include <format>

namespace {

constexpr auto COMPONENT = "GtkPathChooser";

struct DialogState {
    GMainLoop* loop = nullptr;
    std::optional<std::filesystem::path> selection;
};

void on_response(GtkNativeDialog* dialog, int response, gpointer user_data) {
    auto* state = static_cast<DialogState*>(user_data);

    if (response == GTK_RESPONSE_ACCEPT) {
        GFile* file = gtk_file_chooser_get_file(GTK_FILE_CHOOSER(dialog));
        if (file) {
            if (char* path = g_file_get_path(file)) {
                state->selection = std::filesystem::path{path};
                g_free(path);
            }
            g_object_unref(file);
        }
    }

    g_main_loop_quit(state->loop);
}

}  // namespace

auto GtkPathChooser::ensure_initialized() -> bool {
    if (!initialized_) {
        initialized_ = true;
        available_ = gtk_init_check();
        if (!available_) {
            LOG_ERROR(COMPONENT, "No display available for file dialogs");
        }
    }
    return available_;
}

auto GtkPathChooser::choose_file(const std::string& prompt,
                                 const std::vector<std::string>& extensions)
    -> std::optional<std::filesystem::path> {
    return run_dialog(GTK_FILE_CHOOSER_ACTION_OPEN, prompt, extensions);
}

auto GtkPathChooser::choose_directory(const std::string& prompt)
    -> std::optional<std::filesystem::path> {
    return run_dialog(GTK_FILE_CHOOSER_ACTION_SELECT_FOLDER, prompt, {});
}

auto GtkPathChooser::run_dialog(GtkFileChooserAction action, const std::string& prompt,
                                const std::vector<std::string>& extensions)
    -> std::optional<std::filesystem::path> {
    if (!ensure_initialized()) {
        return std::nullopt;
    }

    GtkFileChooserNative* native =
        gtk_file_chooser_native_new(prompt.c_str(), nullptr, action, "_Select", "_Cancel");
    gtk_native_dialog_set_modal(GTK_NATIVE_DIALOG(native), TRUE);

    if (!extensions.empty()) {
        GtkFileFilter* filter = gtk_file_filter_new();
        gtk_file_filter_set_name(filter, "Disk images");
        for (const auto& extension : extensions) {
            gtk_file_filter_add_suffix(filter, extension.c_str());
        }
        gtk_file_chooser_add_filter(GTK_FILE_CHOOSER(native), filter);
        g_object_unref(filter);
    }

    DialogState state;
    state.loop = g_main_loop_new(nullptr, FALSE);

    g_signal_connect(native, "response", G_CALLBACK(on_response), &state);
    gtk_native_dialog_show(GTK_NATIVE_DIALOG(native));
    g_main_loop_run(state.loop);

    g_main_loop_unref(state.loop);
    g_object_unref(native);

    if (state.selection) {
        LOG_INFO(COMPONENT, std::format("'{}' -> {}", prompt, state.selection->string()));
    } else {
        LOG_INFO(COMPONENT, std::format("'{}' cancelled", prompt));
    }
    return state.selection;
}
