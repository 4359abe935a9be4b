#include <gtest/gtest.h>
#include "../core/Settings.hpp"
#include "TempDir.hpp"
#include <fstream>

using namespace metersim;

class SettingsTest : public ::testing::Test {
protected:
    testutil::TempDir dir_;
};

TEST_F(SettingsTest, AbsentFilesGiveDefaults) {
    UplinkSettingsStore uplink(dir_.file("mqtt_settings.json"));
    DeviceSettingsStore device(dir_.file("device_settings.json"));

    UplinkSettings settings = uplink.load();
    EXPECT_FALSE(settings.enabled);
    EXPECT_EQ(settings.brokerPort, 1883);
    EXPECT_EQ(settings.deviceNamePrefix, "iot_sim_");
    EXPECT_EQ(device.measurementInterval(), kDefaultMeasurementInterval);
}

TEST_F(SettingsTest, IntervalIsClamped) {
    DeviceSettingsStore device(dir_.file("device_settings.json"));

    EXPECT_EQ(device.setMeasurementInterval(0), 1);
    EXPECT_EQ(device.measurementInterval(), 1);
    EXPECT_EQ(device.setMeasurementInterval(1000), 300);
    EXPECT_EQ(device.measurementInterval(), 300);
    EXPECT_EQ(device.setMeasurementInterval(12), 12);
    EXPECT_EQ(device.load().autoSaveInterval, 30);
}

TEST_F(SettingsTest, OutOfRangeIntervalInFileIsClampedOnRead) {
    const std::string path = dir_.file("device_settings.json");
    std::ofstream(path) << R"({"measurement_interval": 900, "auto_save_interval": 10})";

    DeviceSettingsStore device(path);
    EXPECT_EQ(device.measurementInterval(), 300);
    EXPECT_EQ(device.load().autoSaveInterval, 10);
}

TEST_F(SettingsTest, UplinkSettingsPersist) {
    UplinkSettingsStore store(dir_.file("nested/mqtt_settings.json"));

    UplinkSettings settings;
    settings.enabled = true;
    settings.brokerHost = "mqtt.example.com";
    settings.tenant = "t100";
    settings.username = "device_user";
    settings.password = "secret";
    settings.useSsl = true;
    ASSERT_TRUE(store.save(settings));

    UplinkSettings loaded = store.load();
    EXPECT_TRUE(loaded.enabled);
    EXPECT_EQ(loaded.brokerHost, "mqtt.example.com");
    EXPECT_EQ(loaded.qualifiedUsername(), "t100/device_user");
    EXPECT_EQ(loaded.effectivePort(), 8883);
}

TEST_F(SettingsTest, LegacyPrefixKeyIsRead) {
    const std::string path = dir_.file("mqtt_settings.json");
    std::ofstream(path) << R"({"enabled": true, "broker_host": "h", "device_prefix": "legacy_"})";

    EXPECT_EQ(UplinkSettingsStore(path).load().deviceNamePrefix, "legacy_");
}

TEST_F(SettingsTest, CorruptFileFallsBackToDefaults) {
    const std::string path = dir_.file("mqtt_settings.json");
    std::ofstream(path) << "{ not json";

    UplinkSettings loaded = UplinkSettingsStore(path).load();
    EXPECT_FALSE(loaded.enabled);
    EXPECT_TRUE(loaded.brokerHost.empty());
}

TEST(UplinkSettingsTest, EffectivePortOnlyMovesDefaultPort) {
    UplinkSettings settings;
    EXPECT_EQ(settings.effectivePort(), 1883);
    settings.useSsl = true;
    EXPECT_EQ(settings.effectivePort(), 8883);
    settings.brokerPort = 9883;
    EXPECT_EQ(settings.effectivePort(), 9883);
    EXPECT_EQ(settings.qualifiedUsername(), "");
}

TEST(UplinkSettingsTest, ApplyAssignment) {
    UplinkSettings settings;
    EXPECT_TRUE(UplinkSettingsStore::applyAssignment(settings, "enabled", "yes"));
    EXPECT_TRUE(settings.enabled);
    EXPECT_TRUE(UplinkSettingsStore::applyAssignment(settings, "broker_port", "8884"));
    EXPECT_EQ(settings.brokerPort, 8884);
    EXPECT_TRUE(UplinkSettingsStore::applyAssignment(settings, "device_prefix", "x_"));
    EXPECT_EQ(settings.deviceNamePrefix, "x_");

    EXPECT_FALSE(UplinkSettingsStore::applyAssignment(settings, "broker_port", "70000"));
    EXPECT_FALSE(UplinkSettingsStore::applyAssignment(settings, "broker_port", "abc"));
    EXPECT_FALSE(UplinkSettingsStore::applyAssignment(settings, "use_ssl", "maybe"));
    EXPECT_FALSE(UplinkSettingsStore::applyAssignment(settings, "color", "red"));
}
