#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "api/HttpTransport.h"
#include "core/Config.h"
#include "model/Park.h"
#include "model/WaitTimesData.h"
#include "utils/TimeHelper.h"

/**
 * @brief Outcome of one refresh attempt across all parks.
 *
 * On total failure fetchSuccess is false and snapshot is the previously
 * retained snapshot (unchanged), or null when nothing was ever fetched.
 */
struct FetchResult {
    bool fetchSuccess{false};
    std::string errorMessage;
    TimeHelper::TimePoint attemptedAt{};
    std::shared_ptr<const WaitTimesData> snapshot;
};

/**
 * @brief Anything that can produce wait-time snapshots.
 */
class WaitTimesSource {
public:
    virtual ~WaitTimesSource() = default;

    /** Never throws: failures are reported in the result. */
    virtual FetchResult fetchAll() = 0;

    /** Abort pending retry delays (shutdown). */
    virtual void cancel() {}
};

/**
 * @brief Client for queue-times.com.
 *
 * GET https://queue-times.com/parks/{id}/queue_times.json for every
 * catalog park. Each request is tried up to maxRetries times with
 * retryDelay seconds in between.
 */
class QueueTimesClient : public WaitTimesSource {
public:
    static constexpr auto URL_TEMPLATE{"https://queue-times.com/parks/%u/queue_times.json"};
    static constexpr auto ALL_PARKS_FAILED{"Failed to fetch data from all parks"};

    QueueTimesClient(HttpTransport &transport, const Config::ApiSettings &settings);

    FetchResult fetchAll() override;

    void cancel() override;

    /**
     * @brief Fetch one park.
     * @return std::nullopt once every attempt failed
     */
    std::optional<Park> fetchPark(const ParkInfo &info);

    std::shared_ptr<const WaitTimesData> cached() const;

    /**
     * @brief Parse a queue_times.json body.
     * @throws api_exception If the body is not valid JSON of the expected shape
     *
     * Rides are read from every lands[].rides[] and from the top-level
     * rides[] list. A null or missing wait_time counts as 0.
     */
    static std::vector<Ride> parseRides(const std::string &body, const ParkInfo &info);

    static std::string urlFor(const ParkInfo &info);

private:
    static constexpr auto tag_{"QueueTimes"};

    HttpTransport &transport_;
    Config::ApiSettings settings_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
    std::shared_ptr<const WaitTimesData> cache_;

    Park requestPark(const ParkInfo &info);

    /** @return false when cancelled during the wait */
    bool waitBeforeRetry();
};
