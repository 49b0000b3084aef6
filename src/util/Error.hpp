/**
 * @file Error.hpp
 * @brief Error value carried by std::expected across the acquisition engine
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Failure classes an acquisition step can report
 */
enum class ErrorKind {
    PROCESS_SPAWN_FAILURE,  ///< Child process could not be started
    PROCESS_EXIT_FAILURE,   ///< Required command exited with nonzero status
    PARSE_FAILURE,          ///< External tool output had an unexpected shape
    USER_CANCELLED,         ///< Interactive chooser returned no selection
    DETACH_WARNING,         ///< Volume could not be detached (non-fatal)
    IO_FAILURE              ///< File system read/write failure
};

/**
 * @struct Error
 * @brief An error kind, a human-readable message and an optional code
 *
 * The code carries the child exit status for PROCESS_EXIT_FAILURE and
 * errno-style values for IO_FAILURE.
 */
struct Error {
    ErrorKind kind = ErrorKind::IO_FAILURE;
    std::string message;
    int code = 0;

    Error() = default;
    Error(ErrorKind err_kind, std::string msg, int err_code = 0)
        : kind(err_kind), message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }
};

/**
 * @brief Short name of an error kind, used in log lines
 */
[[nodiscard]] constexpr auto kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::PROCESS_SPAWN_FAILURE:
            return "ProcessSpawnFailure";
        case ErrorKind::PROCESS_EXIT_FAILURE:
            return "ProcessExitFailure";
        case ErrorKind::PARSE_FAILURE:
            return "ParseFailure";
        case ErrorKind::USER_CANCELLED:
            return "UserCancelled";
        case ErrorKind::DETACH_WARNING:
            return "DetachWarning";
        case ErrorKind::IO_FAILURE:
            return "IoFailure";
    }
    return "Unknown";
}

}  // namespace util
