#include "DeviceWorker.hpp"
#include "../Settings.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace metersim::domain {

DeviceWorker::DeviceWorker(std::string deviceId,
                           DeviceType type,
                           std::chrono::seconds interval,
                           MeasurementGenerator& generator,
                           ports::IMeasurementSink& sink,
                           UplinkSession* uplink)
    : deviceId_(std::move(deviceId)),
      type_(type),
      interval_(std::chrono::seconds(clampMeasurementInterval(static_cast<int>(interval.count())))),
      generator_(generator),
      sink_(sink),
      uplink_(uplink) {
    if (deviceId_.empty()) {
        throw std::invalid_argument("DeviceWorker requires a device id");
    }
}

MeasurementSample DeviceWorker::step() {
    if (!previousLoaded_) {
        try {
            previous_ = sink_.latestMeasurement(deviceId_);
            if (previous_) {
                std::cout << tag() << " Resuming from " << previous_->kwh << " kWh" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << tag() << " Could not read previous sample: " << e.what() << std::endl;
        }
        previousLoaded_ = true;
    }

    MeasurementSample sample = generator_.next(type_, deviceId_, previous_, interval_);

    try {
        sink_.insertMeasurement(sample);
    } catch (const std::exception& e) {
        ++storeFailures_;
        std::cerr << tag() << " Failed to store sample: " << e.what() << std::endl;
    }
    previous_ = sample;
    ++samples_;

    if (uplink_ && uplink_->isConnected()) {
        if (!uplink_->sendMeasurement(sample)) {
            ++forwardFailures_;
            std::cerr << tag() << " Failed to forward sample" << std::endl;
        }
    }

    return sample;
}

void DeviceWorker::run(const std::function<bool()>& keepRunning) {
    std::cout << tag() << " Sampling every " << interval_.count() << "s" << std::endl;

    while (keepRunning()) {
        const MeasurementSample sample = step();
        std::cout << tag() << " " << sample.voltage << " V, " << sample.current << " A, "
                  << sample.power << " W, " << sample.kwh << " kWh" << std::endl;

        const auto wakeAt = std::chrono::steady_clock::now() + interval_;
        while (keepRunning()) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= wakeAt) {
                break;
            }
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kSleepSlice, wakeAt - now));
        }
    }

    if (uplink_) {
        uplink_->disconnect();
    }
    std::cout << tag() << " Stopped after " << samples_ << " sample(s)" << std::endl;
}

std::string DeviceWorker::tag() const {
    return "[Worker " + deviceId_ + "]";
}

} // namespace metersim::domain
