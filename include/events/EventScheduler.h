#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/Config.h"
#include "events/ScheduledEvent.h"
#include "utils/TimeHelper.h"

/**
 * @brief Next show and how long until it starts.
 */
struct UpcomingEvent {
    ScheduledEvent event;
    int64_t secondsUntilStart{0};
};

/**
 * @brief Daily show schedule.
 *
 * Built once from configuration. Bad entries (unknown park keys, malformed
 * times) are dropped with a warning; construction never throws.
 */
class EventScheduler {
public:
    EventScheduler() = default;

    explicit EventScheduler(const Config::EventsSettings &settings);

    /**
     * @brief Parse "H:MM" or "HH:MM" (24-hour).
     * @param text Time string
     * @return Seconds since midnight, empty when malformed or out of range
     */
    static std::optional<uint32_t> parseTime(const std::string &text);

    /**
     * @brief Split "park=HH:MM,HH:MM;park=HH:MM" into (park key, times) pairs.
     */
    static std::vector<std::pair<std::string, std::vector<std::string>>> parseSchedule(const std::string &text);

    /**
     * @brief First show, in schedule order, whose window contains now.
     */
    std::optional<ScheduledEvent> activeEvent(TimeHelper::TimePoint now) const;

    /**
     * @brief Show with the nearest start; starts at or before now roll to tomorrow.
     */
    std::optional<UpcomingEvent> nextEvent(TimeHelper::TimePoint now) const;

    /**
     * @brief Replace the schedule with one show that started a second ago.
     * @param kind "fireworks", "fireworks-epcot" or "parade"
     * @param now Current time
     * @return false for an unknown kind (schedule unchanged)
     */
    bool injectTestEvent(const std::string &kind, TimeHelper::TimePoint now);

    const std::vector<ScheduledEvent> &events() const { return events_; }

private:
    static constexpr auto tag_{"Scheduler"};

    std::vector<ScheduledEvent> events_;

    void addShows(EventType type, const Config::ShowSettings &show, uint32_t defaultDuration);
};
