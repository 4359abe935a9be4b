#include <gtest/gtest.h>
#include "../platform/desktop/TomlConfig.hpp"
#include <sstream>

using namespace metersim;

TEST(TomlConfigTest, DefaultsWhenFileMissing) {
    AppConfig config = TomlConfig::loadFromFile("/nonexistent/metersim.toml");
    EXPECT_EQ(config.statusFile, "device_status.json");
    EXPECT_EQ(config.databasePath, "iot_devices.db");
    EXPECT_EQ(config.stopGraceSeconds, 3);
    EXPECT_EQ(config.heartbeatSeconds, 60);
}

TEST(TomlConfigTest, ParsesSections) {
    std::istringstream input(R"(
# fleet
[storage]
status_file = "/var/lib/metersim/status.json"
database_path = /var/lib/metersim/data.db   # unquoted

[settings]
device_settings_file = "dev.json"
uplink_settings_file = "up.json"

[supervisor]
stop_grace_seconds = 5
kill_grace_seconds = 1

[uplink]
connect_timeout_seconds = 20
heartbeat_seconds = 30
restart_delay_seconds = 0
)");

    AppConfig config = TomlConfig::parse(input);
    EXPECT_EQ(config.statusFile, "/var/lib/metersim/status.json");
    EXPECT_EQ(config.databasePath, "/var/lib/metersim/data.db");
    EXPECT_EQ(config.deviceSettingsFile, "dev.json");
    EXPECT_EQ(config.uplinkSettingsFile, "up.json");
    EXPECT_EQ(config.stopGraceSeconds, 5);
    EXPECT_EQ(config.killGraceSeconds, 1);
    EXPECT_EQ(config.connectTimeoutSeconds, 20);
    EXPECT_EQ(config.heartbeatSeconds, 30);
    EXPECT_EQ(config.restartDelaySeconds, 0);
}

TEST(TomlConfigTest, MalformedNumbersKeepDefaults) {
    std::istringstream input("[supervisor]\nstop_grace_seconds = soon\nkill_grace_seconds = -4\n"
                             "[unknown]\nstatus_file = x\n");

    AppConfig config = TomlConfig::parse(input);
    EXPECT_EQ(config.stopGraceSeconds, 3);
    EXPECT_EQ(config.killGraceSeconds, 2);
    EXPECT_EQ(config.statusFile, "device_status.json");
}
