#include "Measurement.hpp"
#include <cmath>

namespace metersim {

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

MeasurementGenerator::MeasurementGenerator(IRng& rng, const IClock& clock)
    : rng_(rng), clock_(clock) {}

MeasurementSample MeasurementGenerator::next(DeviceType type,
                                             const std::string& deviceId,
                                             const std::optional<MeasurementSample>& previous,
                                             std::chrono::seconds nominalInterval) {
    const DeviceTypeSpec& spec = DeviceRegistry::spec(type);
    const auto now = clock_.now();

    MeasurementSample sample;
    sample.deviceId = deviceId;
    sample.timestamp = formatIso8601(now);
    sample.voltage = roundTo(rng_.uniform(spec.voltage.min, spec.voltage.max), 2);
    sample.current = roundTo(rng_.uniform(spec.current.min, spec.current.max), 2);
    sample.power = roundTo(sample.voltage * sample.current, 2);

    double cumulative = 0.0;
    std::chrono::duration<double> elapsed = nominalInterval;
    if (previous) {
        cumulative = previous->kwh;
        auto previousTime = parseIso8601(previous->timestamp);
        if (previousTime) {
            elapsed = now - *previousTime;
        }
    }
    // Clock steps backwards must not make the counter run down
    if (elapsed.count() < 0.0) {
        elapsed = std::chrono::duration<double>::zero();
    }

    sample.kwh = cumulative + energyKwh(sample.power, elapsed);
    return sample;
}

double MeasurementGenerator::energyKwh(double powerWatts, std::chrono::duration<double> elapsed) {
    return (powerWatts / 1000.0) * (elapsed.count() / 3600.0);
}

} // namespace metersim
