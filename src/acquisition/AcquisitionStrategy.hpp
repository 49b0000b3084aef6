/**
 * @file AcquisitionStrategy.hpp
 * @brief Base class for acquisition methods
 */

#pragma once

#include "acquisition/AcquisitionServices.hpp"
#include "models/AcquisitionTypes.hpp"

#include <string>

/**
 * @class AcquisitionStrategy
 * @brief One way of producing a verified copy of a source plus its report
 *
 * execute() never throws: every outcome, including early aborts, is a
 * Report whose success flag tells the caller what happened.
 */
class AcquisitionStrategy {
public:
    virtual ~AcquisitionStrategy() = default;

    AcquisitionStrategy(const AcquisitionStrategy&) = delete;
    AcquisitionStrategy& operator=(const AcquisitionStrategy&) = delete;

    /**
     * @brief Run the acquisition
     * @param params Caller-supplied case and path parameters
     * @return Report of the run; success is true only if the final artifact
     *         exists, was hashed and the report file was written
     */
    [[nodiscard]] virtual auto execute(const Parameters& params) -> Report = 0;

    /**
     * @brief Display name written into the report
     */
    [[nodiscard]] virtual auto get_name() const -> std::string = 0;

    [[nodiscard]] virtual auto get_description() const -> std::string = 0;

protected:
    explicit AcquisitionStrategy(AcquisitionServices& services) : services_(services) {}

    /**
     * @brief Create the report and fill in the steps common to all methods
     *
     * Stamps the start time, gathers the hardware description and inspects
     * the source path. None of these steps can abort the run.
     */
    [[nodiscard]] auto begin_report(const Parameters& params) -> Report {
        Report report{params, get_name()};
        report.start_time = Report::Clock::now();
        report.hardware_info = services_.inspector.hardware_description();
        report.path_details = services_.inspector.describe(params.source);
        return report;
    }

    AcquisitionServices& services_;
};
