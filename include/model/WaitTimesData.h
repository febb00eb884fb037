#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "model/Park.h"
#include "model/Ride.h"
#include "utils/TimeHelper.h"

/**
 * @brief One card in the rotation: a ride or a closed-park notice.
 */
using DisplayItem = std::variant<Ride, ClosedPark>;

/**
 * @brief Result of one fetch across all parks.
 *
 * parks keeps catalog order. A snapshot is immutable once published;
 * the rotation holds it through a shared_ptr<const WaitTimesData>.
 */
struct WaitTimesData {
    std::vector<Park> parks;
    std::optional<TimeHelper::TimePoint> lastFetch;
    bool fetchSuccess{false};
    std::string errorMessage;

    /**
     * @brief Find a park by slug.
     * @return nullptr if the park was not fetched
     */
    const Park *findPark(const std::string &slug) const;

    /**
     * @brief Open rides of every park, sorted by park name then wait descending.
     */
    std::vector<Ride> allOpenRides() const;

    /**
     * @brief Parks that have no open ride, in park order.
     */
    std::vector<ClosedPark> closedParks() const;

    /**
     * @brief True when no fetch time is known or data is older than 15 minutes.
     */
    bool isStale(TimeHelper::TimePoint now) const;

    /**
     * @brief Whole minutes since lastFetch, -1 when unknown.
     */
    int64_t ageMinutes(TimeHelper::TimePoint now) const;
};

/**
 * @brief Build the rotation queue: open rides followed by closed-park notices.
 */
std::vector<DisplayItem> buildDisplayQueue(const WaitTimesData &data);
