#include "services/DetachSupervisor.hpp"

#include "util/Logger.hpp"

#include <format>

namespace {
constexpr auto COMPONENT = "DetachSupervisor";
}

DetachSupervisor::DetachSupervisor(IProcessRunner& runner, ISleeper& sleeper,
                                   const ToolCommands& tools)
    : runner_(runner), sleeper_(sleeper), tools_(tools) {}

auto DetachSupervisor::detach(const std::string& volume, std::chrono::seconds delay,
                              std::chrono::seconds interval, int max_attempts) -> bool {
    if (delay.count() > 0) {
        sleeper_.sleep_for(delay);
    }

    const std::vector<std::string> args{tools_.image_tool, "detach", volume};

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        auto result = runner_.run_captured(args, false);
        if (result && result->succeeded()) {
            LOG_INFO(COMPONENT, std::format("Detached {} (attempt {}/{})", volume, attempt,
                                            max_attempts));
            return true;
        }

        LOG_WARNING(COMPONENT,
                    std::format("Detach of {} failed (attempt {}/{}): {}", volume, attempt,
                                max_attempts,
                                result ? std::format("exit {}", result->exit_code)
                                       : result.error().message));

        if (attempt < max_attempts) {
            sleeper_.sleep_for(interval);
        }
    }

    LOG_ERROR(COMPONENT, std::format("Giving up on detaching {}", volume));
    return false;
}
