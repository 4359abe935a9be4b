/**
 * @file DeviceStatusStore.hpp
 * @brief Durable status file shared by the supervisor and its workers
 *
 * The file holds the per-type id counters and one entry per device. The
 * supervisor rewrites counters and device records; workers add the
 * cumulocity_* registration keys to their own entry. Every write is a whole
 * file read-modify-write through a temp file and rename, so a reader never
 * sees a torn file, but two concurrent writers can lose one update.
 */

#pragma once

#include "DeviceType.hpp"
#include "ports/IRegistrationLedger.hpp"
#include <map>
#include <optional>
#include <string>

namespace metersim {

enum class DeviceStatus {
    Stopped,
    Active
};

std::string deviceStatusToString(DeviceStatus status);
std::optional<DeviceStatus> parseDeviceStatus(const std::string& text);

struct DeviceRecord {
    std::string deviceId;
    DeviceType deviceType = DeviceType::PV;
    DeviceStatus status = DeviceStatus::Stopped;   ///< Last known intent, not live truth
    std::string createdAt;
};

struct StatusSnapshot {
    std::map<std::string, int> counters;           ///< Raw keys as found in the file
    std::map<std::string, DeviceRecord> devices;
};

class DeviceStatusStore {
public:
    explicit DeviceStatusStore(std::string path);

    /// Empty snapshot when the file is absent or unreadable
    StatusSnapshot load() const;

    /**
     * @brief Replace counters and device records
     *
     * Keys other than the record fields are kept for devices that are still
     * present, so registration data written by workers survives.
     */
    bool save(const StatusSnapshot& snapshot) const;

    std::optional<ports::RegistrationInfo> registration(const std::string& deviceId) const;

    /// Fails when the device has no entry in the file
    bool recordRegistration(const std::string& deviceId, const ports::RegistrationInfo& info) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace metersim
