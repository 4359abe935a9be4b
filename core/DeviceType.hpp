#pragma once

#include <optional>
#include <string>
#include <vector>

namespace metersim {

enum class DeviceType {
    PV,
    HeatPump,
    MainGrid
};

struct ValueRange {
    double min = 0.0;
    double max = 0.0;
};

/**
 * @brief Registry row for one device type
 *
 * typeId doubles as the device identifier prefix ("pv" -> pv001) and as the
 * counter key in the status file. Adding a device type means adding an enum
 * value and one row to the table in DeviceType.cpp.
 */
struct DeviceTypeSpec {
    DeviceType type;
    std::string displayName;   ///< Name written to the status file ("Heat Pump")
    std::string enumName;      ///< Enum spelling ("HeatPump"), accepted on input
    std::string typeId;        ///< Identifier prefix and counter key ("heatpump")
    std::string iconClass;     ///< Dashboard icon hint
    std::string colorClass;    ///< Dashboard colour hint
    ValueRange voltage;        ///< Volts
    ValueRange current;        ///< Amperes
};

class DeviceRegistry {
public:
    static const std::vector<DeviceTypeSpec>& all();
    static const DeviceTypeSpec& spec(DeviceType type);

    /// Accepts display name, enum name or type id, case-insensitively
    static std::optional<DeviceType> parse(const std::string& text);

    /// Resolves the type from an identifier such as "heatpump004"
    static std::optional<DeviceType> fromDeviceId(const std::string& deviceId);

    static std::string formatDeviceId(DeviceType type, int counter);

    /// Numeric suffix of a device id of the given type, or nullopt
    static std::optional<int> counterOf(DeviceType type, const std::string& deviceId);
};

std::string deviceTypeToString(DeviceType type);

} // namespace metersim
