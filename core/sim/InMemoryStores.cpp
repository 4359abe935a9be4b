#include "InMemoryStores.hpp"
#include <algorithm>
#include <set>

namespace metersim::sim {

void InMemoryMeasurementSink::insertMeasurement(const MeasurementSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        throw ports::SinkError("simulated write failure");
    }
    samples_.push_back(sample);
}

std::optional<MeasurementSample> InMemoryMeasurementSink::latestMeasurement(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = samples_.rbegin(); it != samples_.rend(); ++it) {
        if (it->deviceId == deviceId) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<MeasurementSample> InMemoryMeasurementSink::getMeasurements(const std::string& deviceId,
                                                                        int limit, int offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MeasurementSample> result;
    int skipped = 0;
    for (auto it = samples_.rbegin(); it != samples_.rend(); ++it) {
        if (!deviceId.empty() && it->deviceId != deviceId) {
            continue;
        }
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        if (static_cast<int>(result.size()) >= limit) {
            break;
        }
        result.push_back(*it);
    }
    return result;
}

std::int64_t InMemoryMeasurementSink::measurementCount(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (deviceId.empty()) {
        return static_cast<std::int64_t>(samples_.size());
    }
    return std::count_if(samples_.begin(), samples_.end(),
                         [&](const MeasurementSample& s) { return s.deviceId == deviceId; });
}

std::int64_t InMemoryMeasurementSink::deviceCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> devices;
    for (const auto& sample : samples_) {
        devices.insert(sample.deviceId);
    }
    return static_cast<std::int64_t>(devices.size());
}

std::int64_t InMemoryMeasurementSink::deleteDeviceMeasurements(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        throw ports::SinkError("simulated write failure");
    }
    const auto before = samples_.size();
    samples_.erase(std::remove_if(samples_.begin(), samples_.end(),
                                  [&](const MeasurementSample& s) { return s.deviceId == deviceId; }),
                   samples_.end());
    return static_cast<std::int64_t>(before - samples_.size());
}

void InMemoryMeasurementSink::saveDeviceConfig(const std::string& deviceId, const std::string& deviceType,
                                               const std::string& status) {
    (void)deviceType;
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_) {
        throw ports::SinkError("simulated write failure");
    }
    configs_[deviceId] = status;
}

void InMemoryMeasurementSink::deleteDeviceConfig(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_.erase(deviceId);
}

void InMemoryMeasurementSink::setFailWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = fail;
}

std::map<std::string, std::string> InMemoryMeasurementSink::deviceConfigs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configs_;
}

std::optional<ports::RegistrationInfo> InMemoryRegistrationLedger::lookup(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(deviceId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryRegistrationLedger::record(const std::string& deviceId, const ports::RegistrationInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[deviceId] = info;
    ++records_;
    return true;
}

int InMemoryRegistrationLedger::recordCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

} // namespace metersim::sim
