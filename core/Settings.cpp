#include "Settings.hpp"
#include "JsonCodec.hpp"
#include <algorithm>
#include <iostream>

namespace metersim {

namespace {

bool parseBool(const std::string& value, bool& out) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

int clampMeasurementInterval(int seconds) {
    return std::clamp(seconds, kMinMeasurementInterval, kMaxMeasurementInterval);
}

std::uint16_t UplinkSettings::effectivePort() const {
    if (useSsl && brokerPort == 1883) {
        return 8883;
    }
    return brokerPort;
}

std::string UplinkSettings::qualifiedUsername() const {
    if (tenant.empty()) {
        return username;
    }
    return tenant + "/" + username;
}

UplinkSettingsStore::UplinkSettingsStore(std::string path) : path_(std::move(path)) {}

UplinkSettings UplinkSettingsStore::load() const {
    auto doc = JsonCodec::readFile(path_);
    if (!doc) {
        return UplinkSettings{};
    }
    try {
        return JsonCodec::jsonToUplinkSettings(*doc);
    } catch (const std::exception& e) {
        std::cerr << "[Config] Invalid uplink settings in " << path_ << ": " << e.what() << std::endl;
        return UplinkSettings{};
    }
}

bool UplinkSettingsStore::save(const UplinkSettings& settings) const {
    return JsonCodec::writeFile(path_, JsonCodec::uplinkSettingsToJson(settings));
}

bool UplinkSettingsStore::applyAssignment(UplinkSettings& settings, const std::string& key, const std::string& value) {
    try {
        if (key == "enabled") {
            return parseBool(value, settings.enabled);
        } else if (key == "use_ssl") {
            return parseBool(value, settings.useSsl);
        } else if (key == "broker_host") {
            settings.brokerHost = value;
        } else if (key == "broker_port") {
            int port = std::stoi(value);
            if (port <= 0 || port > 65535) {
                return false;
            }
            settings.brokerPort = static_cast<std::uint16_t>(port);
        } else if (key == "username") {
            settings.username = value;
        } else if (key == "password") {
            settings.password = value;
        } else if (key == "tenant") {
            settings.tenant = value;
        } else if (key == "ca_cert_path") {
            settings.caCertPath = value;
        } else if (key == "client_cert_path") {
            settings.clientCertPath = value;
        } else if (key == "client_key_path") {
            settings.clientKeyPath = value;
        } else if (key == "device_name_prefix" || key == "device_prefix") {
            settings.deviceNamePrefix = value;
        } else {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

DeviceSettingsStore::DeviceSettingsStore(std::string path) : path_(std::move(path)) {}

DeviceSettings DeviceSettingsStore::load() const {
    auto doc = JsonCodec::readFile(path_);
    if (!doc) {
        return DeviceSettings{};
    }
    try {
        return JsonCodec::jsonToDeviceSettings(*doc);
    } catch (const std::exception& e) {
        std::cerr << "[Config] Invalid device settings in " << path_ << ": " << e.what() << std::endl;
        return DeviceSettings{};
    }
}

bool DeviceSettingsStore::save(const DeviceSettings& settings) const {
    return JsonCodec::writeFile(path_, JsonCodec::deviceSettingsToJson(settings));
}

int DeviceSettingsStore::measurementInterval() const {
    return clampMeasurementInterval(load().measurementInterval);
}

int DeviceSettingsStore::setMeasurementInterval(int seconds) {
    DeviceSettings settings = load();
    settings.measurementInterval = clampMeasurementInterval(seconds);
    if (!save(settings)) {
        std::cerr << "[Config] Failed to persist measurement interval to " << path_ << std::endl;
    }
    return settings.measurementInterval;
}

} // namespace metersim
