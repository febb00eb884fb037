#include "model/WaitTimesData.h"
#include "core/Constants.h"

#include <algorithm>

const Park *WaitTimesData::findPark(const std::string &slug) const {
    for (const auto &p : parks) {
        if (p.slug == slug) return &p;
    }
    return nullptr;
}

std::vector<Ride> WaitTimesData::allOpenRides() const {
    std::vector<Ride> rides;
    for (const auto &park : parks) {
        auto open = park.openRides();
        rides.insert(rides.end(), open.begin(), open.end());
    }
    std::stable_sort(rides.begin(), rides.end(), [](const Ride &a, const Ride &b) {
        if (a.parkName != b.parkName) return a.parkName < b.parkName;
        return a.waitTime > b.waitTime;
    });
    return rides;
}

std::vector<ClosedPark> WaitTimesData::closedParks() const {
    std::vector<ClosedPark> closed;
    for (const auto &park : parks) {
        if (park.openRides().empty()) {
            closed.push_back(ClosedPark{park.name, park.slug, Constants::Park::DEFAULT_OPENS_AT});
        }
    }
    return closed;
}

bool WaitTimesData::isStale(TimeHelper::TimePoint now) const {
    if (!lastFetch) return true;
    return TimeHelper::elapsedSeconds(*lastFetch, now) >
           static_cast<double>(Constants::Freshness::STALE_AFTER_SEC);
}

int64_t WaitTimesData::ageMinutes(TimeHelper::TimePoint now) const {
    if (!lastFetch) return -1;
    return TimeHelper::secondsBetween(*lastFetch, now) / 60;
}

std::vector<DisplayItem> buildDisplayQueue(const WaitTimesData &data) {
    std::vector<DisplayItem> queue;
    for (auto &ride : data.allOpenRides()) {
        queue.emplace_back(std::move(ride));
    }
    for (auto &park : data.closedParks()) {
        queue.emplace_back(std::move(park));
    }
    return queue;
}
