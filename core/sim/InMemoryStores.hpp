#pragma once

#include "../ports/IMeasurementSink.hpp"
#include "../ports/IRegistrationLedger.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace metersim::sim {

class InMemoryMeasurementSink : public ports::IMeasurementSink {
public:
    void insertMeasurement(const MeasurementSample& sample) override;
    std::optional<MeasurementSample> latestMeasurement(const std::string& deviceId) override;
    std::vector<MeasurementSample> getMeasurements(const std::string& deviceId,
                                                   int limit, int offset = 0) override;
    std::int64_t measurementCount(const std::string& deviceId = "") override;
    std::int64_t deviceCount() override;
    std::int64_t deleteDeviceMeasurements(const std::string& deviceId) override;

    void saveDeviceConfig(const std::string& deviceId, const std::string& deviceType,
                          const std::string& status) override;
    void deleteDeviceConfig(const std::string& deviceId) override;

    // Test controls
    void setFailWrites(bool fail);
    std::map<std::string, std::string> deviceConfigs() const;

private:
    mutable std::mutex mutex_;
    std::vector<MeasurementSample> samples_;   ///< Insertion order
    std::map<std::string, std::string> configs_;
    bool failWrites_ = false;
};

class InMemoryRegistrationLedger : public ports::IRegistrationLedger {
public:
    std::optional<ports::RegistrationInfo> lookup(const std::string& deviceId) const override;
    bool record(const std::string& deviceId, const ports::RegistrationInfo& info) override;

    int recordCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ports::RegistrationInfo> entries_;
    int records_ = 0;
};

} // namespace metersim::sim
