/**
 * @file SmartRestCodec.hpp
 * @brief Cumulocity SmartREST 2.0 static template lines
 *
 * Upstream lines go to s/us, commands arrive on s/ds. Fields are comma
 * separated; a field containing a comma or a quote is double-quoted.
 */

#pragma once

#include "Measurement.hpp"
#include <optional>
#include <string>
#include <vector>

namespace metersim {

enum class AlarmSeverity {
    Critical,   ///< 301
    Major,      ///< 302
    Minor,      ///< 303
    Warning     ///< 304
};

std::optional<AlarmSeverity> parseAlarmSeverity(const std::string& text);

/// One parsed inbound line: template code plus the remaining fields
struct SmartRestLine {
    int code = 0;
    std::vector<std::string> fields;
};

class SmartRestCodec {
public:
    static constexpr const char* kUpstreamTopic = "s/us";
    static constexpr const char* kDownstreamTopic = "s/ds";

    static constexpr int kRestartCommand = 510;

    /// 100,<name>,<type>
    static std::string registration(const std::string& deviceName, const std::string& deviceType);

    /// Four 200 lines (voltage, current, power, energy) joined by '\n'
    static std::string measurement(const MeasurementSample& sample);

    /// 400,c8y_Heartbeat,Device heartbeat
    static std::string heartbeat();

    static std::string alarm(const std::string& type, const std::string& text, AlarmSeverity severity);

    static std::string operationExecuting(const std::string& fragment);    ///< 501
    static std::string operationSuccessful(const std::string& fragment);   ///< 503

    /// Splits a payload into lines and parses each; malformed lines are dropped
    static std::vector<SmartRestLine> parse(const std::string& payload);

    static std::string formatNumber(double value);

private:
    static std::string quote(const std::string& field);
};

} // namespace metersim
