/**
 * @file MockDiskInspector.hpp
 * @brief Google Mock implementation of IDiskInspector
 */

#pragma once

#include "interfaces/IDiskInspector.hpp"

#include <gmock/gmock.h>

class MockDiskInspector : public IDiskInspector {
public:
    MOCK_METHOD(PathDetails, describe, (const std::filesystem::path& path), (override));
    MOCK_METHOD(std::string, hardware_description, (), (override));
};
