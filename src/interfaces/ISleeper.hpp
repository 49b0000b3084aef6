/**
 * @file ISleeper.hpp
 * @brief Injectable delay used by retrying operations
 */

#pragma once

#include <chrono>

/**
 * @class ISleeper
 * @brief Interface for waiting between attempts
 *
 * Tests substitute a recorder so retry schedules run instantly.
 */
class ISleeper {
public:
    virtual ~ISleeper() = default;

    virtual void sleep_for(std::chrono::seconds duration) = 0;
};
