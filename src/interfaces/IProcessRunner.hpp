/**
 * @file IProcessRunner.hpp
 * @brief Interface for running external commands
 *
 * Every external tool the acquisition engine depends on goes through this
 * interface so orchestration logic can be exercised without the tools.
 */

#pragma once

#include "models/AcquisitionTypes.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @class IProcessRunner
 * @brief Abstract interface for blocking child process execution
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run a command and capture its standard output
     * @param args Program followed by its arguments
     * @param keep_awake Prevent system idle sleep while the child runs
     * @return Exit code and stdout, or PROCESS_SPAWN_FAILURE
     */
    [[nodiscard]] virtual auto run_captured(const std::vector<std::string>& args,
                                            bool keep_awake)
        -> std::expected<ProcessResult, util::Error> = 0;

    /**
     * @brief Run a command, echoing its merged stdout/stderr as it arrives
     * @param args Program followed by its arguments
     * @param keep_awake Prevent system idle sleep while the child runs
     * @param tee_file If set, the accumulated output is written there on exit
     * @return Exit code and the echoed bytes, or PROCESS_SPAWN_FAILURE
     */
    [[nodiscard]] virtual auto run_streamed(const std::vector<std::string>& args, bool keep_awake,
                                            const std::optional<std::filesystem::path>& tee_file)
        -> std::expected<ProcessResult, util::Error> = 0;
};
