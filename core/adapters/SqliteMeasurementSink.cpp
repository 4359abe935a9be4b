#include "SqliteMeasurementSink.hpp"
#include <sqlite3.h>
#include <iostream>

namespace metersim::adapters {

namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS measurements (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    device_id TEXT NOT NULL,
    timestamp TEXT NOT NULL,
    voltage REAL NOT NULL,
    current REAL NOT NULL,
    power REAL NOT NULL,
    kwh REAL NOT NULL,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
CREATE INDEX IF NOT EXISTS idx_device_timestamp ON measurements(device_id, timestamp);
CREATE TABLE IF NOT EXISTS device_configs (
    device_id TEXT PRIMARY KEY,
    device_type TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'stopped',
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
)sql";

/// Prepared statement owner
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw ports::SinkError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }

    void bind(int index, double value) {
        check(sqlite3_bind_double(stmt_, index, value));
    }

    void bind(int index, int value) {
        check(sqlite3_bind_int(stmt_, index, value));
    }

    /// true while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw ports::SinkError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    std::string text(int column) const {
        const unsigned char* value = sqlite3_column_text(stmt_, column);
        return value ? reinterpret_cast<const char*>(value) : std::string();
    }

    double real(int column) const {
        return sqlite3_column_double(stmt_, column);
    }

    std::int64_t integer(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw ports::SinkError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }
};

MeasurementSample readSample(const Statement& stmt) {
    MeasurementSample sample;
    sample.deviceId = stmt.text(0);
    sample.timestamp = stmt.text(1);
    sample.voltage = stmt.real(2);
    sample.current = stmt.real(3);
    sample.power = stmt.real(4);
    sample.kwh = stmt.real(5);
    return sample;
}

} // namespace

SqliteMeasurementSink::SqliteMeasurementSink(const std::string& databasePath) : path_(databasePath) {
    if (path_.empty()) {
        throw std::invalid_argument("SqliteMeasurementSink requires a database path");
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw ports::SinkError("cannot open " + path_ + ": " + message);
    }

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);

    try {
        execute(kSchema);
    } catch (const ports::SinkError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteMeasurementSink::~SqliteMeasurementSink() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteMeasurementSink::execute(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        fail(message);
    }
}

void SqliteMeasurementSink::fail(const std::string& what) const {
    throw ports::SinkError(path_ + ": " + what);
}

void SqliteMeasurementSink::insertMeasurement(const MeasurementSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT INTO measurements (device_id, timestamp, voltage, current, power, kwh) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    stmt.bind(1, sample.deviceId);
    stmt.bind(2, sample.timestamp);
    stmt.bind(3, sample.voltage);
    stmt.bind(4, sample.current);
    stmt.bind(5, sample.power);
    stmt.bind(6, sample.kwh);
    stmt.step();
}

std::optional<MeasurementSample> SqliteMeasurementSink::latestMeasurement(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "SELECT device_id, timestamp, voltage, current, power, kwh FROM measurements "
        "WHERE device_id = ? ORDER BY timestamp DESC, id DESC LIMIT 1");
    stmt.bind(1, deviceId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return readSample(stmt);
}

std::vector<MeasurementSample> SqliteMeasurementSink::getMeasurements(const std::string& deviceId,
                                                                      int limit, int offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MeasurementSample> samples;

    if (deviceId.empty()) {
        Statement stmt(db_,
            "SELECT device_id, timestamp, voltage, current, power, kwh FROM measurements "
            "ORDER BY timestamp DESC, id DESC LIMIT ? OFFSET ?");
        stmt.bind(1, limit);
        stmt.bind(2, offset);
        while (stmt.step()) {
            samples.push_back(readSample(stmt));
        }
    } else {
        Statement stmt(db_,
            "SELECT device_id, timestamp, voltage, current, power, kwh FROM measurements "
            "WHERE device_id = ? ORDER BY timestamp DESC, id DESC LIMIT ? OFFSET ?");
        stmt.bind(1, deviceId);
        stmt.bind(2, limit);
        stmt.bind(3, offset);
        while (stmt.step()) {
            samples.push_back(readSample(stmt));
        }
    }
    return samples;
}

std::int64_t SqliteMeasurementSink::measurementCount(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (deviceId.empty()) {
        Statement stmt(db_, "SELECT COUNT(*) FROM measurements");
        return stmt.step() ? stmt.integer(0) : 0;
    }
    Statement stmt(db_, "SELECT COUNT(*) FROM measurements WHERE device_id = ?");
    stmt.bind(1, deviceId);
    return stmt.step() ? stmt.integer(0) : 0;
}

std::int64_t SqliteMeasurementSink::deviceCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(DISTINCT device_id) FROM measurements");
    return stmt.step() ? stmt.integer(0) : 0;
}

std::int64_t SqliteMeasurementSink::deleteDeviceMeasurements(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM measurements WHERE device_id = ?");
    stmt.bind(1, deviceId);
    stmt.step();

    const std::int64_t purged = sqlite3_changes(db_);
    std::cout << "[Sink] Deleted " << purged << " measurements for device " << deviceId << std::endl;
    return purged;
}

void SqliteMeasurementSink::saveDeviceConfig(const std::string& deviceId, const std::string& deviceType,
                                             const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT INTO device_configs (device_id, device_type, status) VALUES (?, ?, ?) "
        "ON CONFLICT(device_id) DO UPDATE SET device_type = excluded.device_type, "
        "status = excluded.status, updated_at = CURRENT_TIMESTAMP");
    stmt.bind(1, deviceId);
    stmt.bind(2, deviceType);
    stmt.bind(3, status);
    stmt.step();
}

void SqliteMeasurementSink::deleteDeviceConfig(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "DELETE FROM device_configs WHERE device_id = ?");
    stmt.bind(1, deviceId);
    stmt.step();
}

std::string SqliteMeasurementSink::deviceConfigStatus(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "SELECT status FROM device_configs WHERE device_id = ?");
    stmt.bind(1, deviceId);
    return stmt.step() ? stmt.text(0) : std::string();
}

} // namespace metersim::adapters
