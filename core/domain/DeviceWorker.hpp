#pragma once

#include "../Measurement.hpp"
#include "../ports/IMeasurementSink.hpp"
#include "UplinkSession.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace metersim::domain {

/**
 * @brief Sampling loop of one device, run inside its worker process
 *
 * Each iteration generates a sample, stores it, forwards it when the uplink
 * is connected and sleeps for the interval. Storage and forwarding failures
 * are logged and the loop carries on.
 */
class DeviceWorker {
public:
    DeviceWorker(std::string deviceId,
                 DeviceType type,
                 std::chrono::seconds interval,
                 MeasurementGenerator& generator,
                 ports::IMeasurementSink& sink,
                 UplinkSession* uplink = nullptr);

    /// One iteration without the sleep
    MeasurementSample step();

    /**
     * @brief Loop until keepRunning() turns false, then close the uplink
     * @note The sleep is sliced so a stop request is seen within a fraction of a second
     */
    void run(const std::function<bool()>& keepRunning);

    std::uint64_t samplesTaken() const { return samples_; }
    std::uint64_t storeFailures() const { return storeFailures_; }
    std::uint64_t forwardFailures() const { return forwardFailures_; }
    std::chrono::seconds interval() const { return interval_; }

private:
    static constexpr auto kSleepSlice = std::chrono::milliseconds(200);

    std::string deviceId_;
    DeviceType type_;
    std::chrono::seconds interval_;
    MeasurementGenerator& generator_;
    ports::IMeasurementSink& sink_;
    UplinkSession* uplink_;

    std::optional<MeasurementSample> previous_;
    bool previousLoaded_ = false;

    std::uint64_t samples_ = 0;
    std::uint64_t storeFailures_ = 0;
    std::uint64_t forwardFailures_ = 0;

    std::string tag() const;
};

} // namespace metersim::domain
