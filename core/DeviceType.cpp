#include "DeviceType.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace metersim {

namespace {

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool isAllDigits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

const std::vector<DeviceTypeSpec>& DeviceRegistry::all() {
    static const std::vector<DeviceTypeSpec> table = {
        {DeviceType::PV, "PV", "PV", "pv",
         "fas fa-solar-panel", "text-warning", {200.0, 250.0}, {5.0, 15.0}},
        {DeviceType::HeatPump, "Heat Pump", "HeatPump", "heatpump",
         "fas fa-thermometer-half", "text-info", {220.0, 240.0}, {8.0, 20.0}},
        {DeviceType::MainGrid, "Main Grid", "MainGrid", "maingrid",
         "fas fa-bolt", "text-primary", {230.0, 240.0}, {10.0, 50.0}},
    };
    return table;
}

const DeviceTypeSpec& DeviceRegistry::spec(DeviceType type) {
    for (const auto& entry : all()) {
        if (entry.type == type) {
            return entry;
        }
    }
    throw std::invalid_argument("DeviceRegistry: no registry entry for device type");
}

std::optional<DeviceType> DeviceRegistry::parse(const std::string& text) {
    const std::string wanted = toLower(text);
    for (const auto& entry : all()) {
        if (wanted == toLower(entry.displayName) ||
            wanted == toLower(entry.enumName) ||
            wanted == entry.typeId) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::optional<DeviceType> DeviceRegistry::fromDeviceId(const std::string& deviceId) {
    // Longest prefix wins so a future "pvx" type cannot shadow "pv"
    const DeviceTypeSpec* best = nullptr;
    for (const auto& entry : all()) {
        if (deviceId.compare(0, entry.typeId.size(), entry.typeId) == 0 &&
            isAllDigits(deviceId.substr(entry.typeId.size()))) {
            if (!best || entry.typeId.size() > best->typeId.size()) {
                best = &entry;
            }
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return best->type;
}

std::string DeviceRegistry::formatDeviceId(DeviceType type, int counter) {
    std::ostringstream ss;
    ss << spec(type).typeId << std::setfill('0') << std::setw(3) << counter;
    return ss.str();
}

std::optional<int> DeviceRegistry::counterOf(DeviceType type, const std::string& deviceId) {
    const std::string& prefix = spec(type).typeId;
    if (deviceId.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    const std::string suffix = deviceId.substr(prefix.size());
    if (!isAllDigits(suffix) || suffix.size() > 9) {
        return std::nullopt;
    }
    return std::stoi(suffix);
}

std::string deviceTypeToString(DeviceType type) {
    return DeviceRegistry::spec(type).displayName;
}

} // namespace metersim
