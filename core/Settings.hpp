/**
 * @file Settings.hpp
 * @brief Process-wide settings files: uplink broker settings and sampling settings
 *
 * Both settings files are plain JSON documents that the operator edits through
 * the CLI. There is no versioning: the last writer wins. The supervisor reads
 * them fresh at every use, a worker reads them once at startup.
 *
 * @note An absent or unreadable file yields the defaults
 */

#pragma once

#include <cstdint>
#include <string>

namespace metersim {

/// Sampling interval bounds (seconds)
constexpr int kDefaultMeasurementInterval = 5;
constexpr int kMinMeasurementInterval = 1;
constexpr int kMaxMeasurementInterval = 300;

int clampMeasurementInterval(int seconds);

/**
 * @brief Telemetry broker connection settings
 */
struct UplinkSettings {
    bool enabled = false;
    std::string brokerHost;
    std::uint16_t brokerPort = 1883;
    std::string username;
    std::string password;
    std::string tenant;
    bool useSsl = false;
    std::string caCertPath;                      ///< Trust store for the broker certificate
    std::string clientCertPath;                  ///< Optional, mutual TLS
    std::string clientKeyPath;                   ///< Optional, mutual TLS
    std::string deviceNamePrefix = "iot_sim_";   ///< Prepended to the device id for the remote name

    /// TLS on the plain default port moves to 8883
    std::uint16_t effectivePort() const;

    /// "{tenant}/{username}", or the bare username without a tenant
    std::string qualifiedUsername() const;
};

struct DeviceSettings {
    int measurementInterval = kDefaultMeasurementInterval;   ///< Seconds between samples
    int autoSaveInterval = 30;                               ///< Seconds, carried for the dashboard
};

class UplinkSettingsStore {
public:
    explicit UplinkSettingsStore(std::string path);

    UplinkSettings load() const;
    bool save(const UplinkSettings& settings) const;

    /**
     * @brief Apply one "key=value" edit to settings
     * @return false for an unknown key or a value of the wrong type
     */
    static bool applyAssignment(UplinkSettings& settings, const std::string& key, const std::string& value);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class DeviceSettingsStore {
public:
    explicit DeviceSettingsStore(std::string path);

    DeviceSettings load() const;
    bool save(const DeviceSettings& settings) const;

    /// Fresh read of the file, clamped
    int measurementInterval() const;

    /// Clamps to [1, 300] and persists; returns the stored value
    int setMeasurementInterval(int seconds);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace metersim
