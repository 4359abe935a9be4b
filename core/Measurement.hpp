#pragma once

#include "DeviceType.hpp"
#include "IClock.hpp"
#include "IRng.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace metersim {

struct MeasurementSample {
    std::string deviceId;
    std::string timestamp;   ///< ISO-8601 UTC
    double voltage = 0.0;    ///< V
    double current = 0.0;    ///< A
    double power = 0.0;      ///< W, voltage x current
    double kwh = 0.0;        ///< Cumulative energy since the first sample
};

/**
 * @brief Produces the next sample of one device
 *
 * Voltage and current are drawn from the type's ranges and rounded to two
 * decimals; power is their product. Energy accumulates on top of the
 * previous sample using the real elapsed time between the two timestamps.
 * Without a previous sample the cumulative starts at 0 and the nominal
 * interval stands in for the elapsed time.
 */
class MeasurementGenerator {
public:
    MeasurementGenerator(IRng& rng, const IClock& clock);

    MeasurementSample next(DeviceType type,
                           const std::string& deviceId,
                           const std::optional<MeasurementSample>& previous,
                           std::chrono::seconds nominalInterval);

    /// kWh gained at constant power over the elapsed time
    static double energyKwh(double powerWatts, std::chrono::duration<double> elapsed);

private:
    IRng& rng_;
    const IClock& clock_;
};

double roundTo(double value, int decimals);

} // namespace metersim
