#include "JsonCodec.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace metersim {

std::string JsonCodec::serialize(const MeasurementSample& sample) {
    return sampleToJson(sample).dump();
}

MeasurementSample JsonCodec::deserialize(const std::string& json) {
    return jsonToSample(nlohmann::json::parse(json));
}

nlohmann::json JsonCodec::sampleToJson(const MeasurementSample& sample) {
    nlohmann::json j;

    j["device_id"] = sample.deviceId;
    j["timestamp"] = sample.timestamp;
    j["voltage"] = sample.voltage;
    j["current"] = sample.current;
    j["power"] = sample.power;
    j["kwh"] = sample.kwh;

    return j;
}

MeasurementSample JsonCodec::jsonToSample(const nlohmann::json& json) {
    MeasurementSample sample;

    sample.deviceId = json.value("device_id", "");
    sample.timestamp = json.value("timestamp", "");
    sample.voltage = json.value("voltage", 0.0);
    sample.current = json.value("current", 0.0);
    sample.power = json.value("power", 0.0);
    sample.kwh = json.value("kwh", 0.0);

    return sample;
}

nlohmann::json JsonCodec::uplinkSettingsToJson(const UplinkSettings& settings) {
    return {
        {"enabled", settings.enabled},
        {"broker_host", settings.brokerHost},
        {"broker_port", settings.brokerPort},
        {"username", settings.username},
        {"password", settings.password},
        {"tenant", settings.tenant},
        {"use_ssl", settings.useSsl},
        {"ca_cert_path", settings.caCertPath},
        {"client_cert_path", settings.clientCertPath},
        {"client_key_path", settings.clientKeyPath},
        {"device_name_prefix", settings.deviceNamePrefix}
    };
}

UplinkSettings JsonCodec::jsonToUplinkSettings(const nlohmann::json& json) {
    UplinkSettings settings;

    settings.enabled = json.value("enabled", settings.enabled);
    settings.brokerHost = json.value("broker_host", settings.brokerHost);
    settings.brokerPort = json.value("broker_port", settings.brokerPort);
    settings.username = json.value("username", settings.username);
    settings.password = json.value("password", settings.password);
    settings.tenant = json.value("tenant", settings.tenant);
    settings.useSsl = json.value("use_ssl", settings.useSsl);
    settings.caCertPath = json.value("ca_cert_path", settings.caCertPath);
    settings.clientCertPath = json.value("client_cert_path", settings.clientCertPath);
    settings.clientKeyPath = json.value("client_key_path", settings.clientKeyPath);

    // Older files spell the prefix key "device_prefix"
    if (json.contains("device_name_prefix")) {
        settings.deviceNamePrefix = json.at("device_name_prefix").get<std::string>();
    } else if (json.contains("device_prefix")) {
        settings.deviceNamePrefix = json.at("device_prefix").get<std::string>();
    }

    return settings;
}

nlohmann::json JsonCodec::deviceSettingsToJson(const DeviceSettings& settings) {
    return {
        {"measurement_interval", settings.measurementInterval},
        {"auto_save_interval", settings.autoSaveInterval}
    };
}

DeviceSettings JsonCodec::jsonToDeviceSettings(const nlohmann::json& json) {
    DeviceSettings settings;
    settings.measurementInterval = clampMeasurementInterval(
        json.value("measurement_interval", settings.measurementInterval));
    settings.autoSaveInterval = json.value("auto_save_interval", settings.autoSaveInterval);
    return settings;
}

std::optional<nlohmann::json> JsonCodec::readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json doc;
        in >> doc;
        return doc;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Json] Failed to parse " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

bool JsonCodec::writeFile(const std::string& path, const nlohmann::json& doc) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[Json] Cannot create directory for " << path << ": " << ec.message() << std::endl;
            return false;
        }
    }

    // Unique per process so concurrent writers never share a temp file
    const std::string tmpPath = path + ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[Json] Cannot open " << tmpPath << " for writing" << std::endl;
            return false;
        }
        out << doc.dump(2) << std::endl;
        if (!out.good()) {
            std::cerr << "[Json] Write to " << tmpPath << " failed" << std::endl;
            fs::remove(tmpPath, ec);
            return false;
        }
    }

    fs::rename(tmpPath, target, ec);
    if (ec) {
        std::cerr << "[Json] Cannot replace " << path << ": " << ec.message() << std::endl;
        fs::remove(tmpPath, ec);
        return false;
    }
    return true;
}

} // namespace metersim
