#pragma once

#include "Measurement.hpp"
#include "Settings.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace metersim {

class JsonCodec {
public:
    static std::string serialize(const MeasurementSample& sample);
    static MeasurementSample deserialize(const std::string& json);

    static nlohmann::json sampleToJson(const MeasurementSample& sample);
    static MeasurementSample jsonToSample(const nlohmann::json& json);

    static nlohmann::json uplinkSettingsToJson(const UplinkSettings& settings);
    static UplinkSettings jsonToUplinkSettings(const nlohmann::json& json);

    static nlohmann::json deviceSettingsToJson(const DeviceSettings& settings);
    static DeviceSettings jsonToDeviceSettings(const nlohmann::json& json);

    /// nullopt when the file is absent or not valid JSON
    static std::optional<nlohmann::json> readFile(const std::string& path);

    /// Writes a sibling temp file and renames it over path
    static bool writeFile(const std::string& path, const nlohmann::json& doc);
};

} // namespace metersim
