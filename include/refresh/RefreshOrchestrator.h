#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "api/QueueTimesClient.h"
#include "api/WeatherClient.h"
#include "core/Config.h"
#include "data/WaitTimesDatabase.h"
#include "display/DisplaySink.h"
#include "refresh/PeriodicTask.h"

/**
 * @brief Drives the background refresh of wait times and weather.
 *
 * Successful fetches go to the display and, when a store is configured,
 * into the history database followed by retention cleanup. Failed fetches
 * keep the current cards on screen and only flag the error badge.
 */
class RefreshOrchestrator {
public:
    /**
     * @param store Optional history store
     * @param weather Optional weather source
     */
    RefreshOrchestrator(WaitTimesSource &source, DisplaySink &sink, WaitTimesStore *store,
                        WeatherSource *weather);

    ~RefreshOrchestrator();

    RefreshOrchestrator(const RefreshOrchestrator &) = delete;
    RefreshOrchestrator &operator=(const RefreshOrchestrator &) = delete;

    /**
     * @brief One wait-time cycle.
     * @return true if the fetch succeeded
     */
    bool refreshWaitTimes();

    /**
     * @brief One weather cycle. No-op without a weather source.
     *
     * The display always gets the latest reading; only fresh readings are stored.
     */
    void refreshWeather();

    /** Persist an already-fetched snapshot (the initial fetch at startup). */
    void storeSnapshot(const WaitTimesData &data);

    /** Start the periodic tasks; the first run happens after one interval. */
    void start(const Config::ApiSettings &api, const Config::WeatherSettings &weather);

    /** Cancel pending retries, stop and join both tasks. */
    void stop();

    uint32_t consecutiveFailures() const { return failures_; }

private:
    static constexpr auto tag_{"Refresh"};

    WaitTimesSource &source_;
    DisplaySink &sink_;
    WaitTimesStore *store_;
    WeatherSource *weather_;

    std::atomic<uint32_t> failures_{0};
    std::unique_ptr<PeriodicTask> waitTask_;
    std::unique_ptr<PeriodicTask> weatherTask_;
};
