/**
 * @file ProcessRunner.hpp
 * @brief GLib-based external command execution
 */

#pragma once

#include "interfaces/IProcessRunner.hpp"

#include <iostream>
#include <ostream>
#include <string>
#include <vector>

/**
 * @class ProcessRunner
 * @brief Runs external tools through g_spawn, blocking until they exit
 *
 * The streamed variant reads the child's merged stdout/stderr one byte at a
 * time so that long-running tools (image conversion, copies) show their
 * progress to the operator as it happens.
 */
class ProcessRunner : public IProcessRunner {
public:
    /**
     * @param keep_awake_prefix Wrapper command prepended when keep_awake is set
     * @param echo Stream receiving live output of run_streamed()
     */
    explicit ProcessRunner(std::vector<std::string> keep_awake_prefix,
                           std::ostream& echo = std::cout);
    ~ProcessRunner() override = default;

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    [[nodiscard]] auto run_captured(const std::vector<std::string>& args, bool keep_awake)
        -> std::expected<ProcessResult, util::Error> override;

    [[nodiscard]] auto run_streamed(const std::vector<std::string>& args, bool keep_awake,
                                    const std::optional<std::filesystem::path>& tee_file)
        -> std::expected<ProcessResult, util::Error> override;

    /**
     * @brief Full command line as it will be spawned
     */
    [[nodiscard]] auto command_line(const std::vector<std::string>& args, bool keep_awake) const
        -> std::vector<std::string>;

private:
    std::vector<std::string> keep_awake_prefix_;
    std::ostream& echo_;
};
