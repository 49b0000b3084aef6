/**
 * @file DetachSupervisor.hpp
 * @brief Bounded-retry detach of attached disk image volumes
 */

#pragma once

#include "interfaces/IProcessRunner.hpp"
#include "interfaces/ISleeper.hpp"
#include "models/AcquisitionTypes.hpp"
#include "models/ToolCommands.hpp"

#include <chrono>
#include <string>

/**
 * @class DetachSupervisor
 * @brief Detaches a volume, retrying while it reports busy
 *
 * Detaching is the only retried operation in an acquisition: freshly written
 * volumes often still have in-flight I/O or open handles. All waiting goes
 * through the injected ISleeper.
 */
class DetachSupervisor {
public:
    DetachSupervisor(IProcessRunner& runner, ISleeper& sleeper, const ToolCommands& tools);

    DetachSupervisor(const DetachSupervisor&) = delete;
    DetachSupervisor& operator=(const DetachSupervisor&) = delete;

    /**
     * @brief Detach a volume
     * @param volume Device or mount point understood by the detach command
     * @param delay Wait before the first attempt
     * @param interval Wait between failed attempts
     * @param max_attempts Total number of attempts
     * @return true as soon as one attempt exits with status 0
     */
    [[nodiscard]] auto detach(const std::string& volume, std::chrono::seconds delay,
                              std::chrono::seconds interval, int max_attempts) -> bool;

    [[nodiscard]] auto detach(const std::string& volume, const DetachPolicy& policy) -> bool {
        return detach(volume, policy.delay, policy.interval, policy.max_attempts);
    }

private:
    IProcessRunner& runner_;
    ISleeper& sleeper_;
    const ToolCommands& tools_;
};
