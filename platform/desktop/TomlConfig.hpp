/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the desktop fleet simulator
 *
 * Provides a simple TOML parser for the application configuration: where the
 * status file, the measurement database and the two JSON settings files live,
 * and the timing knobs of the supervisor and the uplink.
 *
 * Supported Sections:
 * - [storage]: status_file, database_path
 * - [settings]: device_settings_file, uplink_settings_file
 * - [supervisor]: stop_grace_seconds, kill_grace_seconds
 * - [uplink]: connect_timeout_seconds, heartbeat_seconds, restart_delay_seconds
 *
 * @note Simple line-based parser: one key = value per line, '#' comments
 * @note An absent file yields the defaults
 */

#pragma once

#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace metersim {

/**
 * @brief Application configuration with built-in defaults
 *
 * File names match what earlier deployments left in the working directory.
 */
struct AppConfig {
    std::string statusFile = "device_status.json";
    std::string databasePath = "iot_devices.db";
    std::string deviceSettingsFile = "device_settings.json";
    std::string uplinkSettingsFile = "mqtt_settings.json";

    int stopGraceSeconds = 3;
    int killGraceSeconds = 2;

    int connectTimeoutSeconds = 10;
    int heartbeatSeconds = 60;
    int restartDelaySeconds = 2;
};

/**
 * @brief TOML configuration file parser
 *
 * Unknown sections and keys are ignored; a malformed number keeps the
 * default and logs a warning.
 *
 * @note Thread-safe static methods for configuration loading
 */
class TomlConfig {
public:
    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Application configuration, defaults where the file is silent
     */
    static AppConfig loadFromFile(const std::string& filename) {
        AppConfig config;
        std::ifstream file(filename);

        if (!file.is_open()) {
            std::cout << "[Config] No config file at " << filename << ", using defaults" << std::endl;
            return config;
        }

        return parse(file);
    }

    /**
     * @brief Parse configuration text from a stream
     * @param input Stream positioned at the start of the TOML text
     */
    static AppConfig parse(std::istream& input) {
        AppConfig config;
        std::string currentSection;
        std::string line;

        while (std::getline(input, line)) {
            // Remove comments and trim whitespace
            size_t commentPos = line.find('#');
            if (commentPos != std::string::npos) {
                line = line.substr(0, commentPos);
            }
            trim(line);

            // Skip empty lines
            if (line.empty()) {
                continue;
            }

            // Handle section headers
            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            // Parse key = value
            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);

            if (currentSection == "storage") {
                if (key == "status_file") {
                    config.statusFile = value;
                } else if (key == "database_path") {
                    config.databasePath = value;
                }
            } else if (currentSection == "settings") {
                if (key == "device_settings_file") {
                    config.deviceSettingsFile = value;
                } else if (key == "uplink_settings_file") {
                    config.uplinkSettingsFile = value;
                }
            } else if (currentSection == "supervisor") {
                if (key == "stop_grace_seconds") {
                    readSeconds(key, value, config.stopGraceSeconds);
                } else if (key == "kill_grace_seconds") {
                    readSeconds(key, value, config.killGraceSeconds);
                }
            } else if (currentSection == "uplink") {
                if (key == "connect_timeout_seconds") {
                    readSeconds(key, value, config.connectTimeoutSeconds);
                } else if (key == "heartbeat_seconds") {
                    readSeconds(key, value, config.heartbeatSeconds);
                } else if (key == "restart_delay_seconds") {
                    readSeconds(key, value, config.restartDelaySeconds);
                }
            }
        }

        return config;
    }

private:
    /**
     * @brief Parse a non-negative number of seconds into target
     * @note Leaves target untouched on a malformed value
     */
    static void readSeconds(const std::string& key, const std::string& value, int& target) {
        try {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used != value.size() || parsed < 0) {
                throw std::invalid_argument(value);
            }
            target = parsed;
        } catch (const std::exception&) {
            std::cerr << "[Config] Warning: invalid value for " << key << ": '" << value
                      << "', keeping " << target << std::endl;
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace metersim
