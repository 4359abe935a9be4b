#include "SmartRestCodec.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace metersim {

namespace {

std::string trimLineEnd(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(current);
    return fields;
}

} // namespace

std::optional<AlarmSeverity> parseAlarmSeverity(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "critical") return AlarmSeverity::Critical;
    if (lower == "major") return AlarmSeverity::Major;
    if (lower == "minor") return AlarmSeverity::Minor;
    if (lower == "warning") return AlarmSeverity::Warning;
    return std::nullopt;
}

std::string SmartRestCodec::registration(const std::string& deviceName, const std::string& deviceType) {
    return "100," + quote(deviceName) + "," + quote(deviceType);
}

std::string SmartRestCodec::measurement(const MeasurementSample& sample) {
    const std::string& ts = sample.timestamp;
    std::ostringstream out;
    out << "200,c8y_Voltage," << formatNumber(sample.voltage) << ",V," << ts << "\n"
        << "200,c8y_Current," << formatNumber(sample.current) << ",A," << ts << "\n"
        << "200,c8y_Power," << formatNumber(sample.power) << ",W," << ts << "\n"
        << "200,c8y_EnergyConsumption," << formatNumber(sample.kwh) << ",kWh," << ts;
    return out.str();
}

std::string SmartRestCodec::heartbeat() {
    return "400,c8y_Heartbeat,Device heartbeat";
}

std::string SmartRestCodec::alarm(const std::string& type, const std::string& text, AlarmSeverity severity) {
    int code = 303;
    switch (severity) {
        case AlarmSeverity::Critical: code = 301; break;
        case AlarmSeverity::Major:    code = 302; break;
        case AlarmSeverity::Minor:    code = 303; break;
        case AlarmSeverity::Warning:  code = 304; break;
    }
    return std::to_string(code) + "," + quote(type) + "," + quote(text);
}

std::string SmartRestCodec::operationExecuting(const std::string& fragment) {
    return "501," + fragment;
}

std::string SmartRestCodec::operationSuccessful(const std::string& fragment) {
    return "503," + fragment;
}

std::vector<SmartRestLine> SmartRestCodec::parse(const std::string& payload) {
    std::vector<SmartRestLine> lines;
    std::istringstream in(payload);
    std::string raw;

    while (std::getline(in, raw)) {
        std::string line = trimLineEnd(raw);
        if (line.empty()) {
            continue;
        }

        auto fields = splitFields(line);
        SmartRestLine parsed;
        try {
            std::size_t used = 0;
            parsed.code = std::stoi(fields.front(), &used);
            if (used != fields.front().size()) {
                continue;
            }
        } catch (const std::exception&) {
            continue;
        }
        parsed.fields.assign(fields.begin() + 1, fields.end());
        lines.push_back(std::move(parsed));
    }
    return lines;
}

std::string SmartRestCodec::formatNumber(double value) {
    std::ostringstream out;
    out.precision(10);
    out << value;
    return out.str();
}

std::string SmartRestCodec::quote(const std::string& field) {
    if (field.find_first_of(",\"") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += "\"\"";
        } else {
            escaped.push_back(c);
        }
    }
    escaped += "\"";
    return escaped;
}

} // namespace metersim
