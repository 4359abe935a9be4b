/**
 * @file DeviceSupervisor.hpp
 * @brief Lifecycle owner of the device fleet
 *
 * Holds the device records and the handles of the worker processes it
 * spawned. A record's status is the last known intent; liveness is always
 * recomputed from the handle map. Every mutation is persisted to the status
 * file; persistence failures are logged and the in-memory state stays
 * authoritative for this process. Entries another process added to the file
 * are adopted before each write instead of being overwritten.
 *
 * @note Destroying the supervisor leaves workers running; call cleanup()
 */

#pragma once

#include "../DeviceStatusStore.hpp"
#include "../IClock.hpp"
#include "../Settings.hpp"
#include "../ports/IMeasurementSink.hpp"
#include "../ports/IProcessLauncher.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace metersim::domain {

struct SupervisorOptions {
    std::chrono::milliseconds stopGrace{std::chrono::seconds(3)};   ///< After SIGTERM
    std::chrono::milliseconds killGrace{std::chrono::seconds(2)};   ///< After SIGKILL
};

class DeviceSupervisor {
public:
    DeviceSupervisor(DeviceStatusStore& store,
                     DeviceSettingsStore& settings,
                     ports::IProcessLauncher& launcher,
                     ports::IMeasurementSink& sink,
                     const IClock& clock,
                     SupervisorOptions options = {});

    DeviceSupervisor(const DeviceSupervisor&) = delete;
    DeviceSupervisor& operator=(const DeviceSupervisor&) = delete;

    /**
     * @brief Load records and counters, demoting Active records to Stopped
     *
     * No worker can have survived a supervisor restart, so every Active
     * record is stale. Legacy counter keys are merged into the type id key.
     */
    void reconcileOnStartup();

    /// Load without demotion, for commands that do not own the workers
    void load();

    std::string addDevice(DeviceType type);
    bool startDevice(const std::string& deviceId);

    /// Always leaves the record Stopped; false when nothing was running
    bool stopDevice(const std::string& deviceId);

    /// Stops, forgets and purges the device; unknown ids succeed
    bool deleteDevice(const std::string& deviceId);

    std::optional<DeviceRecord> getStatus(const std::string& deviceId);
    std::vector<DeviceRecord> listAll();

    /// Stops every running worker
    void cleanup();

    bool isRunning(const std::string& deviceId);
    std::optional<int> workerPid(const std::string& deviceId);
    std::map<std::string, int> counters() const;

private:
    DeviceStatusStore& store_;
    DeviceSettingsStore& settings_;
    ports::IProcessLauncher& launcher_;
    ports::IMeasurementSink& sink_;
    const IClock& clock_;
    SupervisorOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, DeviceRecord> records_;
    std::map<std::string, std::unique_ptr<ports::IProcessHandle>> processes_;
    std::map<std::string, int> counters_;
    std::set<std::string> removed_;     ///< Deleted here; never adopted back from the file

    void loadLocked(bool demoteActive);
    void foldCountersLocked(const std::map<std::string, int>& counters);
    void adoptExternalLocked();
    bool stopLocked(const std::string& deviceId);
    void refreshLocked(const std::string& deviceId);
    DeviceRecord& ensureRecordLocked(const std::string& deviceId, DeviceType type);
    bool persistLocked();
    void saveConfigRow(const DeviceRecord& record);
};

} // namespace metersim::domain
