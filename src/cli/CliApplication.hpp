/**
 * @file CliApplication.hpp
 * @brief Command-line front end for running an acquisition
 */

#pragma once

#include "models/AcquisitionTypes.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool list_methods = false;
    bool verbose = false;
    bool keep_awake = true;
    bool invalid = false;
    std::string method = "snapshot";
    Parameters params;
    std::optional<std::filesystem::path> snapshot_image;  ///< Preset answer to the image prompt
    std::optional<std::filesystem::path> copy_to;         ///< Preset answer to the destination prompt
};

/**
 * @class CliApplication
 * @brief Wires the acquisition services together and runs one strategy
 */
class CliApplication {
public:
    CliApplication() = default;
    ~CliApplication() = default;

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return 0 when the acquisition succeeded, 1 otherwise
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options; invalid is set for unknown options
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    static void print_help();
    static void print_version();

private:
    auto cmd_acquire(const CliOptions& options) -> int;
    auto cmd_list_methods() -> int;
};

}  // namespace cli
