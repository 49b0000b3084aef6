/**
 * @file MountGuard.hpp
 * @brief Scope guard that detaches a mounted image
 */

#pragma once

#include "models/AcquisitionTypes.hpp"
#include "services/DetachSupervisor.hpp"

#include <string>
#include <utility>

namespace acquisition {

/**
 * @class MountGuard
 * @brief Owns a mounted volume until it has been detached
 *
 * Call detach() to learn the outcome. A guard destroyed without an explicit
 * detach() still runs the detach schedule once.
 */
class MountGuard {
public:
    MountGuard(DetachSupervisor& supervisor, MountedVolume volume, DetachPolicy policy)
        : supervisor_(supervisor), volume_(std::move(volume)), policy_(policy) {}

    ~MountGuard() {
        if (!attempted_) {
            static_cast<void>(detach());
        }
    }

    MountGuard(const MountGuard&) = delete;
    MountGuard& operator=(const MountGuard&) = delete;

    /**
     * @brief Detach the volume (once)
     * @return Outcome of the first and only detach schedule
     */
    auto detach() -> bool {
        if (!attempted_) {
            attempted_ = true;
            detached_ = supervisor_.detach(target(), policy_);
        }
        return detached_;
    }

    /**
     * @brief Identifier handed to the detach command
     *
     * The device when attach reported one, the mount point otherwise.
     */
    [[nodiscard]] auto target() const -> std::string {
        return volume_.device.empty() ? volume_.mount_point.string() : volume_.device;
    }

    [[nodiscard]] auto volume() const -> const MountedVolume& { return volume_; }

private:
    DetachSupervisor& supervisor_;
    MountedVolume volume_;
    DetachPolicy policy_;
    bool attempted_ = false;
    bool detached_ = false;
};

}  // namespace acquisition
