/**
 * @file FakeSleeper.hpp
 * @brief ISleeper that records requested durations instead of sleeping
 */

#pragma once

#include "interfaces/ISleeper.hpp"

#include <vector>

class FakeSleeper : public ISleeper {
public:
    void sleep_for(std::chrono::seconds duration) override { sleeps.push_back(duration); }

    std::vector<std::chrono::seconds> sleeps;
};
