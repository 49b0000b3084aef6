/**
 * @file SystemSleeper.hpp
 * @brief Wall-clock ISleeper
 */

#pragma once

#include "interfaces/ISleeper.hpp"

#include <thread>

/**
 * @class SystemSleeper
 * @brief Blocks the calling thread for the requested duration
 */
class SystemSleeper : public ISleeper {
public:
    void sleep_for(std::chrono::seconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};
