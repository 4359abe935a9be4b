#include <gtest/gtest.h>
#include "../core/domain/DeviceSupervisor.hpp"
#include "../core/sim/InMemoryStores.hpp"
#include "../core/sim/MockProcessLauncher.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "TempDir.hpp"
#include <fstream>
#include <memory>

using namespace metersim;

class DeviceSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        supervisor_ = makeSupervisor();
        supervisor_->reconcileOnStartup();
    }

    std::unique_ptr<domain::DeviceSupervisor> makeSupervisor() {
        return std::make_unique<domain::DeviceSupervisor>(statusStore_, settingsStore_, launcher_, sink_, clock_);
    }

    void storeSample(const std::string& deviceId) {
        MeasurementSample sample;
        sample.deviceId = deviceId;
        sample.timestamp = clock_.iso8601();
        sink_.insertMeasurement(sample);
    }

    testutil::TempDir dir_;
    DeviceStatusStore statusStore_{dir_.file("device_status.json")};
    DeviceSettingsStore settingsStore_{dir_.file("device_settings.json")};
    sim::MockProcessLauncher launcher_;
    sim::InMemoryMeasurementSink sink_;
    sim::SimulatedClock clock_;
    std::unique_ptr<domain::DeviceSupervisor> supervisor_;
};

TEST_F(DeviceSupervisorTest, AddDeviceYieldsIncreasingIds) {
    EXPECT_EQ(supervisor_->addDevice(DeviceType::PV), "pv001");
    EXPECT_EQ(supervisor_->addDevice(DeviceType::PV), "pv002");
    EXPECT_EQ(supervisor_->addDevice(DeviceType::HeatPump), "heatpump001");
    EXPECT_EQ(supervisor_->addDevice(DeviceType::PV), "pv003");

    auto record = supervisor_->getStatus("pv002");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DeviceStatus::Stopped);
    EXPECT_EQ(record->createdAt, "2025-01-01T00:00:00.000Z");

    EXPECT_EQ(statusStore_.load().counters["pv"], 3);
    EXPECT_EQ(sink_.deviceConfigs().at("heatpump001"), "stopped");
}

TEST_F(DeviceSupervisorTest, AddDeviceSkipsTakenIds) {
    supervisor_->startDevice("pv001");
    EXPECT_EQ(supervisor_->addDevice(DeviceType::PV), "pv002");
}

TEST_F(DeviceSupervisorTest, StartTwiceSpawnsOnce) {
    settingsStore_.setMeasurementInterval(7);
    const std::string id = supervisor_->addDevice(DeviceType::MainGrid);

    EXPECT_TRUE(supervisor_->startDevice(id));
    EXPECT_FALSE(supervisor_->startDevice(id));

    ASSERT_EQ(launcher_.launched().size(), 1u);
    EXPECT_EQ(launcher_.liveCount(id), 1);
    EXPECT_EQ(launcher_.launched()[0]->spec.deviceType, DeviceType::MainGrid);
    EXPECT_EQ(launcher_.launched()[0]->spec.intervalSeconds, 7);
    EXPECT_TRUE(supervisor_->isRunning(id));
    EXPECT_EQ(supervisor_->workerPid(id), 1000);
    EXPECT_EQ(supervisor_->getStatus(id)->status, DeviceStatus::Active);
    EXPECT_EQ(statusStore_.load().devices[id].status, DeviceStatus::Active);
}

TEST_F(DeviceSupervisorTest, StartRejectsUnknownPrefix) {
    EXPECT_FALSE(supervisor_->startDevice("battery001"));
    EXPECT_TRUE(launcher_.launched().empty());
}

TEST_F(DeviceSupervisorTest, StartCreatesMissingRecord) {
    EXPECT_TRUE(supervisor_->startDevice("pv005"));

    auto record = supervisor_->getStatus("pv005");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->deviceType, DeviceType::PV);
    EXPECT_EQ(supervisor_->counters()["pv"], 5);
    EXPECT_EQ(supervisor_->addDevice(DeviceType::PV), "pv006");
}

TEST_F(DeviceSupervisorTest, SpawnFailureLeavesRecordStopped) {
    const std::string id = supervisor_->addDevice(DeviceType::PV);
    launcher_.setFailLaunch(true);

    EXPECT_FALSE(supervisor_->startDevice(id));
    EXPECT_FALSE(supervisor_->isRunning(id));
    EXPECT_EQ(supervisor_->getStatus(id)->status, DeviceStatus::Stopped);

    launcher_.setFailLaunch(false);
    EXPECT_TRUE(supervisor_->startDevice(id));
}

TEST_F(DeviceSupervisorTest, StopIsIdempotent) {
    const std::string id = supervisor_->addDevice(DeviceType::PV);
    ASSERT_TRUE(supervisor_->startDevice(id));

    EXPECT_TRUE(supervisor_->stopDevice(id));
    EXPECT_EQ(launcher_.liveCount(id), 0);
    EXPECT_EQ(supervisor_->getStatus(id)->status, DeviceStatus::Stopped);

    EXPECT_FALSE(supervisor_->stopDevice(id));
    EXPECT_EQ(supervisor_->getStatus(id)->status, DeviceStatus::Stopped);
    EXPECT_EQ(statusStore_.load().devices[id].status, DeviceStatus::Stopped);
}

TEST_F(DeviceSupervisorTest, StopEscalatesToKill) {
    const std::string id = supervisor_->addDevice(DeviceType::HeatPump);
    launcher_.nextIgnoresTerminate();
    ASSERT_TRUE(supervisor_->startDevice(id));

    EXPECT_TRUE(supervisor_->stopDevice(id));

    auto process = launcher_.latest(id);
    ASSERT_NE(process, nullptr);
    EXPECT_EQ(process->terminateCalls, 1);
    EXPECT_EQ(process->killCalls, 1);
    EXPECT_FALSE(process->alive);
    EXPECT_FALSE(supervisor_->isRunning(id));
}

TEST_F(DeviceSupervisorTest, ExitedWorkerIsNoticed) {
    const std::string id = supervisor_->addDevice(DeviceType::PV);
    ASSERT_TRUE(supervisor_->startDevice(id));

    launcher_.latest(id)->alive = false;

    EXPECT_FALSE(supervisor_->isRunning(id));
    EXPECT_EQ(supervisor_->getStatus(id)->status, DeviceStatus::Stopped);
    EXPECT_TRUE(supervisor_->startDevice(id));
    EXPECT_EQ(launcher_.launched().size(), 2u);
}

TEST_F(DeviceSupervisorTest, ReloadDemotesActiveRecords) {
    const std::string id = supervisor_->addDevice(DeviceType::PV);
    ASSERT_TRUE(supervisor_->startDevice(id));
    ASSERT_EQ(statusStore_.load().devices[id].status, DeviceStatus::Active);

    // A plain load keeps what the file says
    auto observer = makeSupervisor();
    observer->load();
    EXPECT_EQ(observer->getStatus(id)->status, DeviceStatus::Active);

    auto restarted = makeSupervisor();
    restarted->reconcileOnStartup();
    EXPECT_EQ(restarted->getStatus(id)->status, DeviceStatus::Stopped);
    EXPECT_FALSE(restarted->isRunning(id));
    EXPECT_EQ(statusStore_.load().devices[id].status, DeviceStatus::Stopped);
}

TEST_F(DeviceSupervisorTest, LegacyCountersAreMerged) {
    std::ofstream(statusStore_.path()) << R"({
        "counters": {"PV": 4, "pv": 2, "Heat Pump": 1, "custom": 9},
        "devices": {
            "pv007": {"device_type": "PV", "status": "active", "created_at": "2024-01-01T00:00:00"}
        }
    })";

    supervisor_->reconcileOnStartup();

    auto counters = supervisor_->counters();
    EXPECT_EQ(counters["pv"], 7);
    EXPECT_EQ(counters["heatpump"], 1);
    EXPECT_EQ(counters["custom"], 9);
    EXPECT_EQ(counters.count("PV"), 0u);
    EXPECT_EQ(supervisor_->addDevice(DeviceType::PV), "pv008");
    EXPECT_EQ(supervisor_->addDevice(DeviceType::HeatPump), "heatpump002");
}

TEST_F(DeviceSupervisorTest, DevicesAddedByAnotherProcessSurvive) {
    const std::string own = supervisor_->addDevice(DeviceType::PV);

    // A one-shot command works on its own supervisor over the same file
    auto oneShot = makeSupervisor();
    oneShot->load();
    const std::string external = oneShot->addDevice(DeviceType::PV);
    EXPECT_EQ(external, "pv002");

    ASSERT_TRUE(supervisor_->startDevice(own));
    EXPECT_EQ(statusStore_.load().devices.count(external), 1u);
    EXPECT_TRUE(supervisor_->getStatus(external).has_value());
    EXPECT_EQ(supervisor_->addDevice(DeviceType::PV), "pv003");
}

TEST_F(DeviceSupervisorTest, DeletedDeviceIsNotAdoptedBack) {
    const std::string id = supervisor_->addDevice(DeviceType::MainGrid);
    const std::string kept = supervisor_->addDevice(DeviceType::MainGrid);
    const StatusSnapshot stale = statusStore_.load();
    EXPECT_TRUE(supervisor_->deleteDevice(id));

    // Another writer puts back the file it read before the delete
    ASSERT_TRUE(statusStore_.save(stale));
    supervisor_->addDevice(DeviceType::PV);
    EXPECT_FALSE(supervisor_->getStatus(id).has_value());
    EXPECT_EQ(statusStore_.load().devices.count(id), 0u);
    EXPECT_EQ(statusStore_.load().devices.count(kept), 1u);
}

TEST_F(DeviceSupervisorTest, DeleteRunningDevicePurgesEverything) {
    const std::string id = supervisor_->addDevice(DeviceType::PV);
    ASSERT_TRUE(supervisor_->startDevice(id));
    storeSample(id);
    storeSample(id);
    storeSample("pv999");

    EXPECT_TRUE(supervisor_->deleteDevice(id));

    EXPECT_EQ(launcher_.liveCount(id), 0);
    EXPECT_FALSE(supervisor_->getStatus(id).has_value());
    EXPECT_EQ(sink_.measurementCount(id), 0);
    EXPECT_EQ(sink_.measurementCount("pv999"), 1);
    EXPECT_EQ(sink_.deviceConfigs().count(id), 0u);
    EXPECT_EQ(statusStore_.load().devices.count(id), 0u);
}

TEST_F(DeviceSupervisorTest, DeleteReportsPurgeFailure) {
    const std::string id = supervisor_->addDevice(DeviceType::PV);
    sink_.setFailWrites(true);

    EXPECT_FALSE(supervisor_->deleteDevice(id));
    EXPECT_FALSE(supervisor_->getStatus(id).has_value());
}

TEST_F(DeviceSupervisorTest, DeleteUnknownDeviceSucceeds) {
    EXPECT_TRUE(supervisor_->deleteDevice("pv042"));
}

TEST_F(DeviceSupervisorTest, CleanupStopsAllWorkers) {
    const std::string a = supervisor_->addDevice(DeviceType::PV);
    const std::string b = supervisor_->addDevice(DeviceType::MainGrid);
    ASSERT_TRUE(supervisor_->startDevice(a));
    ASSERT_TRUE(supervisor_->startDevice(b));

    supervisor_->cleanup();

    EXPECT_EQ(launcher_.liveCount(a), 0);
    EXPECT_EQ(launcher_.liveCount(b), 0);
    for (const auto& record : supervisor_->listAll()) {
        EXPECT_EQ(record.status, DeviceStatus::Stopped) << record.deviceId;
    }
}

TEST_F(DeviceSupervisorTest, ListIsSortedById) {
    supervisor_->addDevice(DeviceType::PV);
    supervisor_->addDevice(DeviceType::HeatPump);
    supervisor_->addDevice(DeviceType::MainGrid);

    auto records = supervisor_->listAll();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].deviceId, "heatpump001");
    EXPECT_EQ(records[1].deviceId, "maingrid001");
    EXPECT_EQ(records[2].deviceId, "pv001");
    EXPECT_FALSE(supervisor_->getStatus("pv404").has_value());
}

TEST_F(DeviceSupervisorTest, SinkFailureDoesNotBlockLifecycle) {
    sink_.setFailWrites(true);
    const std::string id = supervisor_->addDevice(DeviceType::PV);

    EXPECT_TRUE(supervisor_->startDevice(id));
    EXPECT_TRUE(supervisor_->stopDevice(id));
}
