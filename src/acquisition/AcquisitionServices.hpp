/**
 * @file AcquisitionServices.hpp
 * @brief Collaborators shared by every acquisition strategy
 */

#pragma once

#include "interfaces/IDiskInspector.hpp"
#include "interfaces/IPathChooser.hpp"
#include "interfaces/IProcessRunner.hpp"
#include "models/AcquisitionTypes.hpp"
#include "models/ToolCommands.hpp"
#include "services/DetachSupervisor.hpp"
#include "services/HashEngine.hpp"
#include "services/ReportWriter.hpp"

/**
 * @struct AcquisitionServices
 * @brief Non-owning bundle of the services a strategy composes
 *
 * The caller owns every referenced object and keeps it alive for the
 * lifetime of the strategies created from the bundle.
 */
struct AcquisitionServices {
    IProcessRunner& runner;
    IDiskInspector& inspector;
    IPathChooser& chooser;
    DetachSupervisor& supervisor;
    HashEngine& hash_engine;
    ReportWriter& report_writer;
    const ToolCommands& tools;
    DetachPolicy detach_policy{};
};
