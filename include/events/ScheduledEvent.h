#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "utils/TimeHelper.h"

/**
 * @brief Kind of scheduled show.
 */
enum class EventType {
    FIREWORKS,
    PARADE
};

constexpr const char *toString(EventType type) {
    switch (type) {
        case EventType::FIREWORKS: return "fireworks";
        case EventType::PARADE: return "parade";
        default: return "UNKNOWN";
    }
}

/**
 * @brief One daily show instance.
 *
 * The window is evaluated on the calendar day of the queried time and
 * does not continue past midnight: a 23:58 show of 240 s is active
 * from 23:58:00 to 23:59:59 only.
 */
struct ScheduledEvent {
    EventType type{EventType::FIREWORKS};
    std::string parkName;
    std::string parkSlug;    ///< hyphenated, e.g. "magic-kingdom"
    uint32_t startSecond{0}; ///< wall-clock seconds past local midnight
    uint32_t durationSeconds{0};

    /** Start of this show on the local day of t. */
    TimeHelper::TimePoint startOn(TimeHelper::TimePoint t) const {
        return TimeHelper::atSecondOfDay(t, startSecond);
    }

    bool isActiveAt(TimeHelper::TimePoint t) const {
        auto start = startOn(t);
        auto end = start + std::chrono::seconds(durationSeconds);
        return start <= t && t < end;
    }

    /** Whole seconds since start, 0 when inactive. */
    uint32_t elapsedSeconds(TimeHelper::TimePoint t) const {
        if (!isActiveAt(t)) return 0;
        return static_cast<uint32_t>(TimeHelper::secondsBetween(startOn(t), t));
    }

    /** Whole seconds until end, 0 when inactive. */
    uint32_t timeRemaining(TimeHelper::TimePoint t) const {
        if (!isActiveAt(t)) return 0;
        auto end = startOn(t) + std::chrono::seconds(durationSeconds);
        return static_cast<uint32_t>(TimeHelper::secondsBetween(t, end));
    }

    /** Asset key, e.g. "magic-kingdom_fireworks". */
    std::string videoKey() const {
        return parkSlug + "_" + toString(type);
    }

    bool operator==(const ScheduledEvent &other) const {
        return type == other.type && parkSlug == other.parkSlug &&
               startSecond == other.startSecond && durationSeconds == other.durationSeconds;
    }

    bool operator!=(const ScheduledEvent &other) const { return !(*this == other); }
};
