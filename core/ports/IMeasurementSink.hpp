#pragma once

#include "../Measurement.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace metersim::ports {

class SinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Append-only measurement store plus device configuration rows
 *
 * Implementations throw SinkError when the backing store fails. Several
 * worker processes write to the same store at once.
 */
class IMeasurementSink {
public:
    virtual ~IMeasurementSink() = default;

    virtual void insertMeasurement(const MeasurementSample& sample) = 0;
    virtual std::optional<MeasurementSample> latestMeasurement(const std::string& deviceId) = 0;

    /// Newest first; an empty deviceId selects all devices
    virtual std::vector<MeasurementSample> getMeasurements(const std::string& deviceId,
                                                           int limit, int offset = 0) = 0;
    virtual std::int64_t measurementCount(const std::string& deviceId = "") = 0;

    /// Distinct devices with at least one sample
    virtual std::int64_t deviceCount() = 0;

    /// Returns the number of purged samples
    virtual std::int64_t deleteDeviceMeasurements(const std::string& deviceId) = 0;

    virtual void saveDeviceConfig(const std::string& deviceId, const std::string& deviceType,
                                  const std::string& status) = 0;
    virtual void deleteDeviceConfig(const std::string& deviceId) = 0;
};

} // namespace metersim::ports
