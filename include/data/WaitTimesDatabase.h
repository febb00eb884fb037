#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "model/Ride.h"
#include "model/Weather.h"
#include "utils/TimeHelper.h"

struct CurrentWait {
    std::string rideName;
    std::string parkName;
    uint32_t waitTime{0};
    bool isOpen{false};
    std::string timestamp;
};

struct WaitSample {
    std::string timestamp;
    uint32_t waitTime{0};
};

/** Average wait of the open rides of one park at one fetch. */
struct ParkSample {
    std::string timestamp;
    double avgWait{0.0};
    uint32_t rideCount{0};
};

struct RideStats {
    uint32_t minWait{0};
    uint32_t maxWait{0};
    double avgWait{0.0}; ///< rounded to one decimal
    uint32_t dataPoints{0};
};

struct DatabaseStats {
    uint64_t waitRecords{0};
    std::optional<std::string> oldestRecord;
    std::optional<std::string> newestRecord;
    std::string dbPath;
    uint32_t retentionDays{0};
};

struct CleanupCounts {
    int waitDeleted{0};
    int weatherDeleted{0};
};

/**
 * @brief Write side used by the refresh tasks.
 */
class WaitTimesStore {
public:
    virtual ~WaitTimesStore() = default;

    virtual void storeWaitTimes(const std::vector<Ride> &rides) = 0;
    virtual void storeWeather(const WeatherData &weather) = 0;
    virtual CleanupCounts cleanupOldData() = 0;
};

/**
 * @brief SQLite history of wait times and weather.
 *
 * Every operation opens its own connection, so the object can be shared
 * between the refresh thread and the dashboard thread without locking.
 * Writes are append-only; timestamps are local "YYYY-MM-DD HH:MM:SS".
 * All failures throw database_exception.
 */
class WaitTimesDatabase : public WaitTimesStore {
public:
    using ClockFn = std::function<TimeHelper::TimePoint()>;

    /**
     * @brief Create the parent directory, tables and indexes if missing.
     * @throws database_exception If the file cannot be opened or initialised
     */
    WaitTimesDatabase(std::string path, uint32_t retentionDays, ClockFn clock = TimeHelper::Clock::now);

    void storeWaitTimes(const std::vector<Ride> &rides) override;

    void storeWeather(const WeatherData &weather) override;

    /** Delete rows older than the retention period. */
    CleanupCounts cleanupOldData() override;

    /** Rows of the most recent fetch, by park then wait descending. */
    std::vector<CurrentWait> currentWaits() const;

    std::vector<WaitSample> rideHistory(const std::string &rideName, uint32_t hours) const;

    std::vector<ParkSample> parkHistory(const std::string &parkName, uint32_t hours) const;

    /** Statistics over open samples of the last days days. */
    RideStats rideStats(const std::string &rideName, uint32_t days) const;

    std::vector<std::string> allRides() const;

    std::vector<std::string> allParks() const;

    DatabaseStats databaseStats() const;

    const std::string &path() const { return path_; }

private:
    static constexpr auto tag_{"Database"};

    std::string path_;
    uint32_t retentionDays_;
    ClockFn clock_;

    void initialize();
    std::string timestampHoursAgo(uint32_t hours) const;
};
