#pragma once

#include <optional>
#include <string>

namespace metersim::ports {

struct RegistrationInfo {
    bool registered = false;
    std::string deviceName;     ///< Name the device was registered under remotely
    std::string registeredAt;   ///< ISO-8601
};

/**
 * @brief Durable record of which devices are already registered remotely
 *
 * Keyed by device id so a restarted worker does not register twice.
 */
class IRegistrationLedger {
public:
    virtual ~IRegistrationLedger() = default;

    virtual std::optional<RegistrationInfo> lookup(const std::string& deviceId) const = 0;
    virtual bool record(const std::string& deviceId, const RegistrationInfo& info) = 0;
};

} // namespace metersim::ports
