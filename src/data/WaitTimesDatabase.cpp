#include "data/WaitTimesDatabase.h"
#include "data/DatabaseException.h"
#include "logging/Logger.h"

#include <cerrno>
#include <cmath>
#include <sqlite3.h>
#include <sys/stat.h>

namespace {
    constexpr const char *SCHEMA[] = {
        "CREATE TABLE IF NOT EXISTS wait_times ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " timestamp DATETIME NOT NULL,"
        " ride_id INTEGER NOT NULL,"
        " ride_name TEXT NOT NULL,"
        " park_name TEXT NOT NULL,"
        " wait_time INTEGER NOT NULL,"
        " is_open BOOLEAN NOT NULL DEFAULT 1)",
        "CREATE INDEX IF NOT EXISTS idx_wait_times_timestamp ON wait_times(timestamp)",
        "CREATE INDEX IF NOT EXISTS idx_wait_times_ride ON wait_times(ride_name)",
        "CREATE INDEX IF NOT EXISTS idx_wait_times_park ON wait_times(park_name)",
        "CREATE TABLE IF NOT EXISTS weather ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " timestamp DATETIME NOT NULL,"
        " temperature REAL NOT NULL,"
        " condition TEXT NOT NULL,"
        " humidity INTEGER,"
        " description TEXT)",
        "CREATE INDEX IF NOT EXISTS idx_weather_timestamp ON weather(timestamp)",
    };

    /**
     * @brief One sqlite3 connection, closed on scope exit.
     */
    class Connection {
    public:
        explicit Connection(const std::string &path) {
            if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
                const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
                sqlite3_close(db_);
                throw database_exception("Cannot open " + path + ": " + message);
            }
            sqlite3_busy_timeout(db_, 2000);
        }

        ~Connection() { sqlite3_close(db_); }

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        sqlite3 *get() const { return db_; }

        void exec(const char *sql) {
            char *error = nullptr;
            if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
                const std::string message = error ? error : "unknown error";
                sqlite3_free(error);
                throw database_exception(std::string("SQL error: ") + message);
            }
        }

    private:
        sqlite3 *db_{nullptr};
    };

    /**
     * @brief Prepared statement with 1-based binds and 0-based columns.
     */
    class Statement {
    public:
        Statement(Connection &conn, const char *sql) : db_{conn.get()} {
            if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
                throw database_exception(std::string("Prepare failed: ") + sqlite3_errmsg(db_));
            }
        }

        ~Statement() { sqlite3_finalize(stmt_); }

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        void bind(int index, const std::string &value) {
            check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
        }

        void bind(int index, int64_t value) { check(sqlite3_bind_int64(stmt_, index, value)); }

        void bind(int index, double value) { check(sqlite3_bind_double(stmt_, index, value)); }

        /** @return true while a row is available */
        bool step() {
            const int rc = sqlite3_step(stmt_);
            if (rc == SQLITE_ROW) return true;
            if (rc == SQLITE_DONE) return false;
            throw database_exception(std::string("Step failed: ") + sqlite3_errmsg(db_));
        }

        void reset() {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }

        bool isNull(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

        int64_t integer(int column) const { return sqlite3_column_int64(stmt_, column); }

        double real(int column) const { return sqlite3_column_double(stmt_, column); }

        std::string text(int column) const {
            const auto *value = sqlite3_column_text(stmt_, column);
            return value ? reinterpret_cast<const char *>(value) : "";
        }

    private:
        sqlite3 *db_;
        sqlite3_stmt *stmt_{nullptr};

        void check(int rc) {
            if (rc != SQLITE_OK) {
                throw database_exception(std::string("Bind failed: ") + sqlite3_errmsg(db_));
            }
        }
    };

    void makeParentDirectories(const std::string &path) {
        for (size_t pos = path.find('/', 1); pos != std::string::npos; pos = path.find('/', pos + 1)) {
            const std::string dir = path.substr(0, pos);
            if (mkdir(dir.c_str(), 0755) == -1 && errno != EEXIST) {
                throw database_exception("Cannot create directory " + dir);
            }
        }
    }

    std::vector<std::string> distinctColumn(const std::string &path, const char *sql) {
        Connection conn(path);
        Statement stmt(conn, sql);
        std::vector<std::string> result;
        while (stmt.step()) {
            result.push_back(stmt.text(0));
        }
        return result;
    }
}

WaitTimesDatabase::WaitTimesDatabase(std::string path, uint32_t retentionDays, ClockFn clock)
    : path_{std::move(path)}, retentionDays_{retentionDays}, clock_{std::move(clock)} {
    if (path_.empty()) {
        throw database_exception("Database path is empty");
    }
    makeParentDirectories(path_);
    initialize();
}

void WaitTimesDatabase::initialize() {
    Connection conn(path_);
    for (const char *sql : SCHEMA) {
        conn.exec(sql);
    }
    Logger::info(Logger::Source::Database, tag_, "Database initialized: %s", path_.c_str());
}

std::string WaitTimesDatabase::timestampHoursAgo(uint32_t hours) const {
    return TimeHelper::formatTimestamp(clock_() - std::chrono::hours(hours));
}

void WaitTimesDatabase::storeWaitTimes(const std::vector<Ride> &rides) {
    if (rides.empty()) {
        return;
    }
    const std::string timestamp = TimeHelper::formatTimestamp(clock_());

    Connection conn(path_);
    conn.exec("BEGIN");
    try {
        Statement stmt(conn, "INSERT INTO wait_times (timestamp, ride_id, ride_name, park_name, wait_time, is_open)"
                             " VALUES (?, ?, ?, ?, ?, ?)");
        for (const auto &ride : rides) {
            stmt.bind(1, timestamp);
            stmt.bind(2, static_cast<int64_t>(ride.id));
            stmt.bind(3, ride.name);
            stmt.bind(4, ride.parkName);
            stmt.bind(5, static_cast<int64_t>(ride.waitTime));
            stmt.bind(6, static_cast<int64_t>(ride.isOpen ? 1 : 0));
            stmt.step();
            stmt.reset();
        }
    } catch (const database_exception &) {
        if (sqlite3_exec(conn.get(), "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            Logger::warn(Logger::Source::Database, tag_, "Rollback failed: %s", sqlite3_errmsg(conn.get()));
        }
        throw;
    }
    conn.exec("COMMIT");
    Logger::debug(Logger::Source::Database, tag_, "Stored %zu wait time records", rides.size());
}

void WaitTimesDatabase::storeWeather(const WeatherData &weather) {
    Connection conn(path_);
    Statement stmt(conn, "INSERT INTO weather (timestamp, temperature, condition, humidity, description)"
                         " VALUES (?, ?, ?, ?, ?)");
    stmt.bind(1, TimeHelper::formatTimestamp(clock_()));
    stmt.bind(2, weather.temperature);
    stmt.bind(3, weather.condition);
    stmt.bind(4, static_cast<int64_t>(weather.humidity));
    stmt.bind(5, weather.description);
    stmt.step();
}

CleanupCounts WaitTimesDatabase::cleanupOldData() {
    const std::string cutoff = timestampHoursAgo(retentionDays_ * 24);
    CleanupCounts counts;

    Connection conn(path_);
    {
        Statement stmt(conn, "DELETE FROM wait_times WHERE timestamp < ?");
        stmt.bind(1, cutoff);
        stmt.step();
        counts.waitDeleted = sqlite3_changes(conn.get());
    }
    {
        Statement stmt(conn, "DELETE FROM weather WHERE timestamp < ?");
        stmt.bind(1, cutoff);
        stmt.step();
        counts.weatherDeleted = sqlite3_changes(conn.get());
    }

    if (counts.waitDeleted > 0 || counts.weatherDeleted > 0) {
        Logger::info(Logger::Source::Database, tag_, "Cleaned up old data: %d wait records, %d weather records",
                     counts.waitDeleted, counts.weatherDeleted);
    }
    return counts;
}

std::vector<CurrentWait> WaitTimesDatabase::currentWaits() const {
    Connection conn(path_);
    std::string latest;
    {
        Statement stmt(conn, "SELECT MAX(timestamp) FROM wait_times");
        if (!stmt.step() || stmt.isNull(0)) {
            return {};
        }
        latest = stmt.text(0);
    }

    Statement stmt(conn, "SELECT ride_name, park_name, wait_time, is_open, timestamp FROM wait_times"
                         " WHERE timestamp = ? ORDER BY park_name, wait_time DESC");
    stmt.bind(1, latest);
    std::vector<CurrentWait> result;
    while (stmt.step()) {
        CurrentWait row;
        row.rideName = stmt.text(0);
        row.parkName = stmt.text(1);
        row.waitTime = static_cast<uint32_t>(stmt.integer(2));
        row.isOpen = stmt.integer(3) != 0;
        row.timestamp = stmt.text(4);
        result.push_back(std::move(row));
    }
    return result;
}

std::vector<WaitSample> WaitTimesDatabase::rideHistory(const std::string &rideName, uint32_t hours) const {
    Connection conn(path_);
    Statement stmt(conn, "SELECT timestamp, wait_time FROM wait_times"
                         " WHERE ride_name = ? AND timestamp >= ? ORDER BY timestamp ASC");
    stmt.bind(1, rideName);
    stmt.bind(2, timestampHoursAgo(hours));

    std::vector<WaitSample> result;
    while (stmt.step()) {
        result.push_back(WaitSample{stmt.text(0), static_cast<uint32_t>(stmt.integer(1))});
    }
    return result;
}

std::vector<ParkSample> WaitTimesDatabase::parkHistory(const std::string &parkName, uint32_t hours) const {
    Connection conn(path_);
    Statement stmt(conn, "SELECT timestamp, AVG(wait_time), COUNT(*) FROM wait_times"
                         " WHERE park_name = ? AND timestamp >= ? AND is_open = 1"
                         " GROUP BY timestamp ORDER BY timestamp ASC");
    stmt.bind(1, parkName);
    stmt.bind(2, timestampHoursAgo(hours));

    std::vector<ParkSample> result;
    while (stmt.step()) {
        result.push_back(ParkSample{stmt.text(0), stmt.real(1), static_cast<uint32_t>(stmt.integer(2))});
    }
    return result;
}

RideStats WaitTimesDatabase::rideStats(const std::string &rideName, uint32_t days) const {
    Connection conn(path_);
    Statement stmt(conn, "SELECT MIN(wait_time), MAX(wait_time), AVG(wait_time), COUNT(*) FROM wait_times"
                         " WHERE ride_name = ? AND timestamp >= ? AND is_open = 1");
    stmt.bind(1, rideName);
    stmt.bind(2, timestampHoursAgo(days * 24));

    RideStats stats;
    if (stmt.step()) {
        stats.minWait = stmt.isNull(0) ? 0 : static_cast<uint32_t>(stmt.integer(0));
        stats.maxWait = stmt.isNull(1) ? 0 : static_cast<uint32_t>(stmt.integer(1));
        stats.avgWait = stmt.isNull(2) ? 0.0 : std::round(stmt.real(2) * 10.0) / 10.0;
        stats.dataPoints = static_cast<uint32_t>(stmt.integer(3));
    }
    return stats;
}

std::vector<std::string> WaitTimesDatabase::allRides() const {
    return distinctColumn(path_, "SELECT DISTINCT ride_name FROM wait_times ORDER BY ride_name");
}

std::vector<std::string> WaitTimesDatabase::allParks() const {
    return distinctColumn(path_, "SELECT DISTINCT park_name FROM wait_times ORDER BY park_name");
}

DatabaseStats WaitTimesDatabase::databaseStats() const {
    Connection conn(path_);
    DatabaseStats stats;
    stats.dbPath = path_;
    stats.retentionDays = retentionDays_;
    {
        Statement stmt(conn, "SELECT COUNT(*) FROM wait_times");
        if (stmt.step()) {
            stats.waitRecords = static_cast<uint64_t>(stmt.integer(0));
        }
    }
    Statement stmt(conn, "SELECT MIN(timestamp), MAX(timestamp) FROM wait_times");
    if (stmt.step()) {
        if (!stmt.isNull(0)) stats.oldestRecord = stmt.text(0);
        if (!stmt.isNull(1)) stats.newestRecord = stmt.text(1);
    }
    return stats;
}
