#include "DeviceSupervisor.hpp"
#include <algorithm>
#include <iostream>

namespace metersim::domain {

DeviceSupervisor::DeviceSupervisor(DeviceStatusStore& store,
                                   DeviceSettingsStore& settings,
                                   ports::IProcessLauncher& launcher,
                                   ports::IMeasurementSink& sink,
                                   const IClock& clock,
                                   SupervisorOptions options)
    : store_(store),
      settings_(settings),
      launcher_(launcher),
      sink_(sink),
      clock_(clock),
      options_(options) {}

void DeviceSupervisor::reconcileOnStartup() {
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked(true);
}

void DeviceSupervisor::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked(false);
}

void DeviceSupervisor::loadLocked(bool demoteActive) {
    StatusSnapshot snapshot = store_.load();

    counters_.clear();
    foldCountersLocked(snapshot.counters);

    records_ = std::move(snapshot.devices);
    removed_.clear();

    int demoted = 0;
    for (auto& [deviceId, record] : records_) {
        auto suffix = DeviceRegistry::counterOf(record.deviceType, deviceId);
        if (suffix) {
            int& counter = counters_[DeviceRegistry::spec(record.deviceType).typeId];
            counter = std::max(counter, *suffix);
        }

        if (demoteActive && record.status == DeviceStatus::Active && processes_.count(deviceId) == 0) {
            record.status = DeviceStatus::Stopped;
            ++demoted;
        }
    }

    std::cout << "[Supervisor] Loaded " << records_.size() << " device(s)";
    if (demoted > 0) {
        std::cout << ", " << demoted << " stale active record(s) reset to stopped";
    }
    std::cout << std::endl;

    if (demoteActive) {
        persistLocked();
    }
}

void DeviceSupervisor::foldCountersLocked(const std::map<std::string, int>& counters) {
    for (const auto& [key, value] : counters) {
        auto type = DeviceRegistry::parse(key);
        if (!type) {
            // Unknown keys are carried along untouched
            counters_[key] = std::max(counters_[key], value);
            continue;
        }
        const std::string& typeId = DeviceRegistry::spec(*type).typeId;
        if (key != typeId) {
            std::cout << "[Supervisor] Migrating counter '" << key << "' to '" << typeId << "'" << std::endl;
        }
        counters_[typeId] = std::max(counters_[typeId], value);
    }
}

void DeviceSupervisor::adoptExternalLocked() {
    StatusSnapshot snapshot = store_.load();
    foldCountersLocked(snapshot.counters);

    for (auto& [deviceId, record] : snapshot.devices) {
        if (records_.count(deviceId) != 0 || removed_.count(deviceId) != 0) {
            continue;
        }
        auto suffix = DeviceRegistry::counterOf(record.deviceType, deviceId);
        if (suffix) {
            int& counter = counters_[DeviceRegistry::spec(record.deviceType).typeId];
            counter = std::max(counter, *suffix);
        }
        std::cout << "[Supervisor] Adopting " << deviceId << " added by another process" << std::endl;
        records_.emplace(deviceId, std::move(record));
    }
}

std::string DeviceSupervisor::addDevice(DeviceType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    adoptExternalLocked();

    const DeviceTypeSpec& spec = DeviceRegistry::spec(type);
    int& counter = counters_[spec.typeId];

    std::string deviceId;
    do {
        ++counter;
        deviceId = DeviceRegistry::formatDeviceId(type, counter);
    } while (records_.count(deviceId) != 0);

    DeviceRecord record;
    record.deviceId = deviceId;
    record.deviceType = type;
    record.status = DeviceStatus::Stopped;
    record.createdAt = clock_.iso8601();
    records_[deviceId] = record;

    if (!persistLocked()) {
        std::cerr << "[Supervisor] Device " << deviceId << " exists in memory only" << std::endl;
    }
    saveConfigRow(record);

    std::cout << "[Supervisor] Added " << spec.displayName << " device " << deviceId << std::endl;
    return deviceId;
}

bool DeviceSupervisor::startDevice(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto type = DeviceRegistry::fromDeviceId(deviceId);
    if (!type) {
        std::cerr << "[Supervisor] Cannot resolve device type of '" << deviceId << "'" << std::endl;
        return false;
    }

    auto running = processes_.find(deviceId);
    if (running != processes_.end()) {
        if (running->second->isAlive()) {
            std::cerr << "[Supervisor] Device " << deviceId << " is already running (pid "
                      << running->second->pid() << ")" << std::endl;
            return false;
        }
        processes_.erase(running);
    }

    DeviceRecord& record = ensureRecordLocked(deviceId, *type);

    ports::WorkerSpec spec;
    spec.deviceId = deviceId;
    spec.deviceType = *type;
    spec.intervalSeconds = settings_.measurementInterval();

    auto handle = launcher_.launch(spec);
    if (!handle) {
        std::cerr << "[Supervisor] Failed to start worker for " << deviceId << std::endl;
        if (record.status != DeviceStatus::Stopped) {
            record.status = DeviceStatus::Stopped;
            persistLocked();
        }
        return false;
    }

    const int pid = handle->pid();
    processes_[deviceId] = std::move(handle);
    record.status = DeviceStatus::Active;
    persistLocked();
    saveConfigRow(record);

    std::cout << "[Supervisor] Started " << deviceId << " (pid " << pid << ", interval "
              << spec.intervalSeconds << "s)" << std::endl;
    return true;
}

bool DeviceSupervisor::stopDevice(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopLocked(deviceId);
}

bool DeviceSupervisor::stopLocked(const std::string& deviceId) {
    auto recordIt = records_.find(deviceId);
    auto it = processes_.find(deviceId);

    if (it == processes_.end()) {
        // Heal a record that claims to be running without a process
        if (recordIt != records_.end() && recordIt->second.status != DeviceStatus::Stopped) {
            recordIt->second.status = DeviceStatus::Stopped;
            persistLocked();
            saveConfigRow(recordIt->second);
        }
        std::cout << "[Supervisor] Device " << deviceId << " is not running" << std::endl;
        return false;
    }

    ports::IProcessHandle& process = *it->second;
    const int pid = process.pid();

    if (process.isAlive()) {
        process.terminate();
        if (!process.waitForExit(options_.stopGrace)) {
            std::cerr << "[Supervisor] Worker " << deviceId << " (pid " << pid
                      << ") ignored SIGTERM, killing" << std::endl;
            process.kill();
            if (!process.waitForExit(options_.killGrace)) {
                std::cerr << "[Supervisor] Worker " << deviceId << " (pid " << pid
                          << ") could not be killed" << std::endl;
            }
        }
    }

    processes_.erase(it);
    if (recordIt != records_.end()) {
        recordIt->second.status = DeviceStatus::Stopped;
        saveConfigRow(recordIt->second);
    }
    persistLocked();

    std::cout << "[Supervisor] Stopped " << deviceId << std::endl;
    return true;
}

bool DeviceSupervisor::deleteDevice(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (processes_.count(deviceId) != 0) {
        stopLocked(deviceId);
    }

    const bool known = records_.erase(deviceId) != 0;
    removed_.insert(deviceId);

    bool purged = true;
    try {
        sink_.deleteDeviceMeasurements(deviceId);
        sink_.deleteDeviceConfig(deviceId);
    } catch (const std::exception& e) {
        std::cerr << "[Supervisor] Failed to purge data of " << deviceId << ": " << e.what() << std::endl;
        purged = false;
    }

    persistLocked();
    if (known) {
        std::cout << "[Supervisor] Deleted " << deviceId << std::endl;
    }
    return purged;
}

std::optional<DeviceRecord> DeviceSupervisor::getStatus(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked(deviceId);

    auto it = records_.find(deviceId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DeviceRecord> DeviceSupervisor::listAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> tracked;
    for (const auto& [deviceId, process] : processes_) {
        tracked.push_back(deviceId);
    }
    for (const auto& deviceId : tracked) {
        refreshLocked(deviceId);
    }

    std::vector<DeviceRecord> result;
    result.reserve(records_.size());
    for (const auto& [deviceId, record] : records_) {
        result.push_back(record);
    }
    return result;
}

void DeviceSupervisor::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> running;
    for (const auto& [deviceId, process] : processes_) {
        running.push_back(deviceId);
    }
    if (running.empty()) {
        return;
    }

    std::cout << "[Supervisor] Stopping " << running.size() << " worker(s)" << std::endl;
    for (const auto& deviceId : running) {
        stopLocked(deviceId);
    }
}

bool DeviceSupervisor::isRunning(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshLocked(deviceId);
    return processes_.count(deviceId) != 0;
}

std::optional<int> DeviceSupervisor::workerPid(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(deviceId);
    if (it == processes_.end()) {
        return std::nullopt;
    }
    return it->second->pid();
}

std::map<std::string, int> DeviceSupervisor::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

void DeviceSupervisor::refreshLocked(const std::string& deviceId) {
    auto it = processes_.find(deviceId);
    if (it == processes_.end()) {
        return;
    }

    auto recordIt = records_.find(deviceId);
    if (it->second->isAlive()) {
        if (recordIt != records_.end()) {
            recordIt->second.status = DeviceStatus::Active;
        }
        return;
    }

    std::cerr << "[Supervisor] Worker " << deviceId << " (pid " << it->second->pid()
              << ") has exited" << std::endl;
    processes_.erase(it);
    if (recordIt != records_.end()) {
        recordIt->second.status = DeviceStatus::Stopped;
        saveConfigRow(recordIt->second);
    }
    persistLocked();
}

DeviceRecord& DeviceSupervisor::ensureRecordLocked(const std::string& deviceId, DeviceType type) {
    auto it = records_.find(deviceId);
    if (it != records_.end()) {
        return it->second;
    }

    DeviceRecord record;
    record.deviceId = deviceId;
    record.deviceType = type;
    record.status = DeviceStatus::Stopped;
    record.createdAt = clock_.iso8601();

    auto suffix = DeviceRegistry::counterOf(type, deviceId);
    if (suffix) {
        int& counter = counters_[DeviceRegistry::spec(type).typeId];
        counter = std::max(counter, *suffix);
    }

    std::cout << "[Supervisor] Creating missing record for " << deviceId << std::endl;
    return records_.emplace(deviceId, std::move(record)).first->second;
}

bool DeviceSupervisor::persistLocked() {
    adoptExternalLocked();

    StatusSnapshot snapshot;
    snapshot.counters = counters_;
    snapshot.devices = records_;

    if (!store_.save(snapshot)) {
        std::cerr << "[Supervisor] Failed to persist status to " << store_.path() << std::endl;
        return false;
    }
    return true;
}

void DeviceSupervisor::saveConfigRow(const DeviceRecord& record) {
    try {
        sink_.saveDeviceConfig(record.deviceId,
                               DeviceRegistry::spec(record.deviceType).displayName,
                               deviceStatusToString(record.status));
    } catch (const std::exception& e) {
        std::cerr << "[Supervisor] Failed to save configuration of " << record.deviceId
                  << ": " << e.what() << std::endl;
    }
}

} // namespace metersim::domain
