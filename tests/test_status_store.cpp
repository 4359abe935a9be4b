#include <gtest/gtest.h>
#include "../core/DeviceStatusStore.hpp"
#include "../core/JsonCodec.hpp"
#include "../core/adapters/StatusFileRegistrationLedger.hpp"
#include "TempDir.hpp"
#include <fstream>

using namespace metersim;

class StatusStoreTest : public ::testing::Test {
protected:
    testutil::TempDir dir_;
    DeviceStatusStore store_{dir_.file("device_status.json")};

    static DeviceRecord record(const std::string& id, DeviceType type, DeviceStatus status) {
        DeviceRecord r;
        r.deviceId = id;
        r.deviceType = type;
        r.status = status;
        r.createdAt = "2025-01-01T00:00:00.000Z";
        return r;
    }
};

TEST_F(StatusStoreTest, MissingFileLoadsEmpty) {
    StatusSnapshot snapshot = store_.load();
    EXPECT_TRUE(snapshot.counters.empty());
    EXPECT_TRUE(snapshot.devices.empty());
}

TEST_F(StatusStoreTest, SaveAndLoad) {
    StatusSnapshot snapshot;
    snapshot.counters["pv"] = 2;
    snapshot.devices["pv002"] = record("pv002", DeviceType::PV, DeviceStatus::Active);
    snapshot.devices["heatpump001"] = record("heatpump001", DeviceType::HeatPump, DeviceStatus::Stopped);
    ASSERT_TRUE(store_.save(snapshot));

    StatusSnapshot loaded = store_.load();
    EXPECT_EQ(loaded.counters["pv"], 2);
    ASSERT_EQ(loaded.devices.size(), 2u);
    EXPECT_EQ(loaded.devices["pv002"].status, DeviceStatus::Active);
    EXPECT_EQ(loaded.devices["heatpump001"].deviceType, DeviceType::HeatPump);

    auto doc = JsonCodec::readFile(store_.path());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["devices"]["heatpump001"]["device_type"].get<std::string>(), "Heat Pump");
    EXPECT_EQ((*doc)["devices"]["pv002"]["status"].get<std::string>(), "active");
}

TEST_F(StatusStoreTest, SavePreservesRegistrationKeys) {
    StatusSnapshot snapshot;
    snapshot.devices["pv001"] = record("pv001", DeviceType::PV, DeviceStatus::Active);
    ASSERT_TRUE(store_.save(snapshot));

    ports::RegistrationInfo info;
    info.registered = true;
    info.deviceName = "iot_sim_pv001";
    info.registeredAt = "2025-01-01T00:00:10.000Z";
    ASSERT_TRUE(store_.recordRegistration("pv001", info));

    snapshot.devices["pv001"].status = DeviceStatus::Stopped;
    ASSERT_TRUE(store_.save(snapshot));

    auto registration = store_.registration("pv001");
    ASSERT_TRUE(registration.has_value());
    EXPECT_TRUE(registration->registered);
    EXPECT_EQ(registration->deviceName, "iot_sim_pv001");
    EXPECT_EQ(store_.load().devices["pv001"].status, DeviceStatus::Stopped);
}

TEST_F(StatusStoreTest, RegistrationNeedsAnEntry) {
    ports::RegistrationInfo info;
    info.registered = true;
    EXPECT_FALSE(store_.recordRegistration("pv009", info));
    EXPECT_FALSE(store_.registration("pv009").has_value());
}

TEST_F(StatusStoreTest, LegacyEntriesAreResolved) {
    std::ofstream(store_.path()) << R"({
        "counters": {"Heat Pump": 3, "pv": "x"},
        "devices": {
            "heatpump003": {"status": "active", "created_at": "2024-06-01T10:00:00"},
            "wind001": {"status": "active"},
            "pv001": "garbage"
        }
    })";

    StatusSnapshot loaded = store_.load();
    EXPECT_EQ(loaded.counters.size(), 1u);
    EXPECT_EQ(loaded.counters["Heat Pump"], 3);
    ASSERT_EQ(loaded.devices.size(), 1u);
    EXPECT_EQ(loaded.devices["heatpump003"].deviceType, DeviceType::HeatPump);
    EXPECT_EQ(loaded.devices["heatpump003"].status, DeviceStatus::Active);
}

TEST_F(StatusStoreTest, LedgerReadsThroughStore) {
    StatusSnapshot snapshot;
    snapshot.devices["maingrid001"] = record("maingrid001", DeviceType::MainGrid, DeviceStatus::Active);
    ASSERT_TRUE(store_.save(snapshot));

    adapters::StatusFileRegistrationLedger ledger(store_);
    EXPECT_FALSE(ledger.lookup("maingrid001").has_value());

    ports::RegistrationInfo info;
    info.registered = true;
    info.deviceName = "iot_sim_maingrid001";
    EXPECT_TRUE(ledger.record("maingrid001", info));
    EXPECT_EQ(ledger.lookup("maingrid001")->deviceName, "iot_sim_maingrid001");
}
