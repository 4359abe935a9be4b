#pragma once

#include "../ports/IMeasurementSink.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace metersim::adapters {

/**
 * @brief File-backed measurement store on SQLite
 *
 * Every worker process opens its own connection to the same database file.
 * The busy timeout lets concurrent writers queue instead of failing.
 */
class SqliteMeasurementSink : public ports::IMeasurementSink {
public:
    /// Opens (creating if needed) the database and its schema; throws SinkError
    explicit SqliteMeasurementSink(const std::string& databasePath);
    ~SqliteMeasurementSink() override;

    SqliteMeasurementSink(const SqliteMeasurementSink&) = delete;
    SqliteMeasurementSink& operator=(const SqliteMeasurementSink&) = delete;

    void insertMeasurement(const MeasurementSample& sample) override;
    std::optional<MeasurementSample> latestMeasurement(const std::string& deviceId) override;
    std::vector<MeasurementSample> getMeasurements(const std::string& deviceId,
                                                   int limit, int offset = 0) override;
    std::int64_t measurementCount(const std::string& deviceId = "") override;
    std::int64_t deviceCount() override;
    std::int64_t deleteDeviceMeasurements(const std::string& deviceId) override;

    void saveDeviceConfig(const std::string& deviceId, const std::string& deviceType,
                          const std::string& status) override;
    void deleteDeviceConfig(const std::string& deviceId) override;

    /// Stored configuration status of a device, empty when absent
    std::string deviceConfigStatus(const std::string& deviceId);

    const std::string& path() const { return path_; }

private:
    static constexpr int kBusyTimeoutMs = 30000;

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    void execute(const char* sql);
    [[noreturn]] void fail(const std::string& what) const;
};

} // namespace metersim::adapters
