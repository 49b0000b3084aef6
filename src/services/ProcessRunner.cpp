#include "services/ProcessRunner.hpp"

#include "util/Logger.hpp"

#include <glib.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <format>
#include <fstream>
#include <utility>

namespace {

constexpr auto COMPONENT = "ProcessRunner";

// g_spawn wants a mutable, null-terminated argv
auto make_argv(const std::vector<std::string>& args) -> std::vector<gchar*> {
    std::vector<gchar*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<gchar*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

auto exit_code_from_wait_status(int wait_status) -> int {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }
    return -1;
}

auto join(const std::vector<std::string>& args) -> std::string {
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

auto spawn_error(const std::vector<std::string>& args, GError* error) -> util::Error {
    auto message = std::format("Failed to spawn {}: {}", args.front(),
                               error ? error->message : "Unknown error");
    if (error) {
        g_error_free(error);
    }
    LOG_ERROR(COMPONENT, message);
    return util::Error{util::ErrorKind::PROCESS_SPAWN_FAILURE, std::move(message)};
}

// Runs in the child after GLib has set up the stdout pipe
void merge_stderr_into_stdout(gpointer /*user_data*/) {
    dup2(STDOUT_FILENO, STDERR_FILENO);
}

}  // namespace

ProcessRunner::ProcessRunner(std::vector<std::string> keep_awake_prefix, std::ostream& echo)
    : keep_awake_prefix_(std::move(keep_awake_prefix)), echo_(echo) {}

auto ProcessRunner::command_line(const std::vector<std::string>& args, bool keep_awake) const
    -> std::vector<std::string> {
    std::vector<std::string> full;
    if (keep_awake) {
        full = keep_awake_prefix_;
    }
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

auto ProcessRunner::run_captured(const std::vector<std::string>& args, bool keep_awake)
    -> std::expected<ProcessResult, util::Error> {
    if (args.empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::PROCESS_SPAWN_FAILURE, "Empty command line"});
    }

    const auto full = command_line(args, keep_awake);
    auto argv = make_argv(full);
    LOG_DEBUG(COMPONENT, std::format("Running {}", join(full)));

    gchar* standard_output = nullptr;
    gchar* standard_error = nullptr;
    gint wait_status = 0;
    GError* error = nullptr;

    const gboolean spawned = g_spawn_sync(nullptr,  // working directory
                                          argv.data(),
                                          nullptr,  // environment (inherit)
                                          G_SPAWN_SEARCH_PATH,
                                          nullptr,  // child setup
                                          nullptr,  // user data
                                          &standard_output, &standard_error, &wait_status,
                                          &error);
    if (!spawned) {
        return std::unexpected(spawn_error(full, error));
    }

    ProcessResult result;
    result.exit_code = exit_code_from_wait_status(wait_status);
    result.output = standard_output ? standard_output : "";

    if (standard_error && *standard_error) {
        LOG_DEBUG(COMPONENT, std::format("{} stderr: {}", full.front(), standard_error));
    }
    g_free(standard_output);
    g_free(standard_error);

    LOG_DEBUG(COMPONENT, std::format("{} exited with {}", full.front(), result.exit_code));
    return result;
}

auto ProcessRunner::run_streamed(const std::vector<std::string>& args, bool keep_awake,
                                 const std::optional<std::filesystem::path>& tee_file)
    -> std::expected<ProcessResult, util::Error> {
    if (args.empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::PROCESS_SPAWN_FAILURE, "Empty command line"});
    }

    const auto full = command_line(args, keep_awake);
    auto argv = make_argv(full);
    LOG_INFO(COMPONENT, std::format("Running {}", join(full)));

    gint stdout_fd = -1;
    GPid child_pid = 0;
    GError* error = nullptr;

    const gboolean spawned = g_spawn_async_with_pipes(
        nullptr,  // working directory
        argv.data(),
        nullptr,  // environment (inherit)
        static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_DO_NOT_REAP_CHILD),
        merge_stderr_into_stdout,
        nullptr,     // user data
        &child_pid,
        nullptr,     // stdin
        &stdout_fd,
        nullptr,     // stderr goes to stdout
        &error);
    if (!spawned) {
        return std::unexpected(spawn_error(full, error));
    }

    GIOChannel* channel = g_io_channel_unix_new(stdout_fd);
    g_io_channel_set_close_on_unref(channel, TRUE);
    g_io_channel_set_encoding(channel, nullptr, nullptr);
    g_io_channel_set_buffered(channel, FALSE);

    ProcessResult result;
    while (true) {
        gchar byte = 0;
        gsize bytes_read = 0;
        const GIOStatus status = g_io_channel_read_chars(channel, &byte, 1, &bytes_read, nullptr);

        if (status == G_IO_STATUS_NORMAL && bytes_read == 1) {
            echo_.put(byte);
            echo_.flush();
            result.output.push_back(byte);
        } else if (status != G_IO_STATUS_AGAIN) {
            break;  // EOF or read error
        }
    }
    g_io_channel_unref(channel);

    int wait_status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(child_pid, &wait_status, 0);
    } while (waited < 0 && errno == EINTR);
    g_spawn_close_pid(child_pid);

    result.exit_code = waited == child_pid ? exit_code_from_wait_status(wait_status) : -1;

    if (tee_file) {
        std::ofstream tee{*tee_file, std::ios::binary | std::ios::trunc};
        if (tee) {
            tee << result.output;
        }
        if (!tee) {
            LOG_WARNING(COMPONENT, std::format("Could not write output log {}",
                                               tee_file->string()));
        }
    }

    LOG_INFO(COMPONENT, std::format("{} exited with {}", full.front(), result.exit_code));
    return result;
}
