#pragma once

#include "../DeviceStatusStore.hpp"
#include "../ports/IRegistrationLedger.hpp"

namespace metersim::adapters {

/// Registration ledger kept in the device's entry of the shared status file
class StatusFileRegistrationLedger : public ports::IRegistrationLedger {
public:
    explicit StatusFileRegistrationLedger(const DeviceStatusStore& store) : store_(store) {}

    std::optional<ports::RegistrationInfo> lookup(const std::string& deviceId) const override {
        return store_.registration(deviceId);
    }

    bool record(const std::string& deviceId, const ports::RegistrationInfo& info) override {
        return store_.recordRegistration(deviceId, info);
    }

private:
    const DeviceStatusStore& store_;
};

} // namespace metersim::adapters
