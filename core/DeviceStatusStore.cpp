#include "DeviceStatusStore.hpp"
#include "JsonCodec.hpp"
#include <iostream>

namespace metersim {

namespace {

constexpr const char* kCounters = "counters";
constexpr const char* kDevices = "devices";
constexpr const char* kRegistered = "cumulocity_registered";
constexpr const char* kDeviceName = "cumulocity_device_name";
constexpr const char* kRegisteredAt = "cumulocity_registered_at";

nlohmann::json emptyDocument() {
    return {{kCounters, nlohmann::json::object()}, {kDevices, nlohmann::json::object()}};
}

nlohmann::json loadDocument(const std::string& path) {
    auto doc = JsonCodec::readFile(path);
    if (!doc || !doc->is_object()) {
        return emptyDocument();
    }
    if (!doc->contains(kCounters) || !(*doc)[kCounters].is_object()) {
        (*doc)[kCounters] = nlohmann::json::object();
    }
    if (!doc->contains(kDevices) || !(*doc)[kDevices].is_object()) {
        (*doc)[kDevices] = nlohmann::json::object();
    }
    return *doc;
}

} // namespace

std::string deviceStatusToString(DeviceStatus status) {
    return status == DeviceStatus::Active ? "active" : "stopped";
}

std::optional<DeviceStatus> parseDeviceStatus(const std::string& text) {
    if (text == "active") return DeviceStatus::Active;
    if (text == "stopped") return DeviceStatus::Stopped;
    return std::nullopt;
}

DeviceStatusStore::DeviceStatusStore(std::string path) : path_(std::move(path)) {}

StatusSnapshot DeviceStatusStore::load() const {
    StatusSnapshot snapshot;
    nlohmann::json doc = loadDocument(path_);

    for (const auto& [key, value] : doc[kCounters].items()) {
        if (value.is_number_integer()) {
            snapshot.counters[key] = value.get<int>();
        } else {
            std::cerr << "[Status] Ignoring non-integer counter '" << key << "'" << std::endl;
        }
    }

    for (const auto& [deviceId, entry] : doc[kDevices].items()) {
        if (!entry.is_object()) {
            std::cerr << "[Status] Ignoring malformed entry for " << deviceId << std::endl;
            continue;
        }

        std::optional<DeviceType> type;
        if (entry.contains("device_type") && entry["device_type"].is_string()) {
            type = DeviceRegistry::parse(entry["device_type"].get<std::string>());
        }
        if (!type) {
            type = DeviceRegistry::fromDeviceId(deviceId);
        }
        if (!type) {
            std::cerr << "[Status] Unknown device type for " << deviceId << ", skipping" << std::endl;
            continue;
        }

        DeviceRecord record;
        record.deviceId = deviceId;
        record.deviceType = *type;
        record.status = parseDeviceStatus(entry.value("status", "stopped")).value_or(DeviceStatus::Stopped);
        record.createdAt = entry.value("created_at", "");
        snapshot.devices.emplace(deviceId, std::move(record));
    }

    return snapshot;
}

bool DeviceStatusStore::save(const StatusSnapshot& snapshot) const {
    nlohmann::json previous = loadDocument(path_);
    nlohmann::json doc = emptyDocument();

    for (const auto& [key, value] : snapshot.counters) {
        doc[kCounters][key] = value;
    }

    for (const auto& [deviceId, record] : snapshot.devices) {
        nlohmann::json entry = nlohmann::json::object();
        const auto& oldDevices = previous[kDevices];
        auto old = oldDevices.find(deviceId);
        if (old != oldDevices.end() && old->is_object()) {
            entry = *old;
        }
        entry["device_type"] = DeviceRegistry::spec(record.deviceType).displayName;
        entry["status"] = deviceStatusToString(record.status);
        entry["created_at"] = record.createdAt;
        doc[kDevices][deviceId] = std::move(entry);
    }

    return JsonCodec::writeFile(path_, doc);
}

std::optional<ports::RegistrationInfo> DeviceStatusStore::registration(const std::string& deviceId) const {
    nlohmann::json doc = loadDocument(path_);
    auto it = doc[kDevices].find(deviceId);
    if (it == doc[kDevices].end() || !it->is_object() || !it->contains(kRegistered)) {
        return std::nullopt;
    }

    ports::RegistrationInfo info;
    info.registered = it->value(kRegistered, false);
    info.deviceName = it->value(kDeviceName, "");
    info.registeredAt = it->value(kRegisteredAt, "");
    return info;
}

bool DeviceStatusStore::recordRegistration(const std::string& deviceId,
                                           const ports::RegistrationInfo& info) const {
    nlohmann::json doc = loadDocument(path_);
    auto it = doc[kDevices].find(deviceId);
    if (it == doc[kDevices].end() || !it->is_object()) {
        std::cerr << "[Status] No entry for " << deviceId << ", registration not recorded" << std::endl;
        return false;
    }

    (*it)[kRegistered] = info.registered;
    (*it)[kDeviceName] = info.deviceName;
    (*it)[kRegisteredAt] = info.registeredAt;
    return JsonCodec::writeFile(path_, doc);
}

} // namespace metersim
