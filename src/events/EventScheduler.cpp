#include "events/EventScheduler.h"
#include "core/Constants.h"
#include "logging/Logger.h"
#include "model/Park.h"

#include <cctype>
#include <limits>

namespace {
    std::string trim(const std::string &s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    std::vector<std::string> split(const std::string &s, char sep) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= s.size()) {
            size_t pos = s.find(sep, start);
            if (pos == std::string::npos) pos = s.size();
            parts.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }
}

EventScheduler::EventScheduler(const Config::EventsSettings &settings) {
    addShows(EventType::FIREWORKS, settings.fireworks, Constants::Event::FIREWORKS_DEFAULT_DURATION_SEC);
    addShows(EventType::PARADE, settings.parades, Constants::Event::PARADE_DEFAULT_DURATION_SEC);
    Logger::info(Logger::Source::Scheduler, tag_, "%zu shows scheduled", events_.size());
}

std::optional<uint32_t> EventScheduler::parseTime(const std::string &text) {
    const std::string t = trim(text);
    const size_t colon = t.find(':');
    if (colon == std::string::npos || colon < 1 || colon > 2 || t.size() != colon + 3) {
        return std::nullopt;
    }
    for (size_t i = 0; i < t.size(); ++i) {
        if (i != colon && !std::isdigit(static_cast<unsigned char>(t[i]))) return std::nullopt;
    }
    const uint32_t hour = static_cast<uint32_t>(std::stoul(t.substr(0, colon)));
    const uint32_t minute = static_cast<uint32_t>(std::stoul(t.substr(colon + 1)));
    if (hour > 23 || minute > 59) {
        return std::nullopt;
    }
    return hour * 3600 + minute * 60;
}

std::vector<std::pair<std::string, std::vector<std::string>>> EventScheduler::parseSchedule(const std::string &text) {
    std::vector<std::pair<std::string, std::vector<std::string>>> entries;
    for (const auto &group : split(text, ';')) {
        const std::string g = trim(group);
        if (g.empty()) continue;

        const size_t eq = g.find('=');
        if (eq == std::string::npos) {
            Logger::warn(Logger::Source::Scheduler, tag_, "Malformed schedule entry: %s", g.c_str());
            continue;
        }

        std::vector<std::string> times;
        for (const auto &t : split(g.substr(eq + 1), ',')) {
            std::string tt = trim(t);
            if (!tt.empty()) times.push_back(tt);
        }
        entries.emplace_back(trim(g.substr(0, eq)), std::move(times));
    }
    return entries;
}

void EventScheduler::addShows(EventType type, const Config::ShowSettings &show, uint32_t defaultDuration) {
    if (!show.enabled) {
        return;
    }
    const uint32_t duration = show.duration > 0 ? show.duration : defaultDuration;

    for (const auto &[parkKey, times] : parseSchedule(show.schedule)) {
        const ParkInfo *park = ParkCatalog::findByKey(parkKey);
        if (park == nullptr) {
            Logger::warn(Logger::Source::Scheduler, tag_, "Unknown park in %s schedule: %s",
                         toString(type), parkKey.c_str());
            continue;
        }

        for (const auto &timeText : times) {
            auto start = parseTime(timeText);
            if (!start) {
                Logger::warn(Logger::Source::Scheduler, tag_, "Invalid time format: %s", timeText.c_str());
                continue;
            }
            events_.push_back(ScheduledEvent{type, park->name, park->eventSlug, *start, duration});
            Logger::info(Logger::Source::Scheduler, tag_, "Scheduled %s: %s at %s (%us)",
                         toString(type), park->name, timeText.c_str(), duration);
        }
    }
}

std::optional<ScheduledEvent> EventScheduler::activeEvent(TimeHelper::TimePoint now) const {
    // Overlapping windows: schedule order decides
    for (const auto &event : events_) {
        if (event.isActiveAt(now)) return event;
    }
    return std::nullopt;
}

std::optional<UpcomingEvent> EventScheduler::nextEvent(TimeHelper::TimePoint now) const {
    std::optional<UpcomingEvent> best;
    double bestSeconds = std::numeric_limits<double>::infinity();

    for (const auto &event : events_) {
        auto start = event.startOn(now);
        if (start <= now) {
            start = TimeHelper::nextDay(start);
        }
        const double until = TimeHelper::elapsedSeconds(now, start);
        if (until < bestSeconds) {
            bestSeconds = until;
            best = UpcomingEvent{event, static_cast<int64_t>(until)};
        }
    }
    return best;
}

bool EventScheduler::injectTestEvent(const std::string &kind, TimeHelper::TimePoint now) {
    EventType type;
    const ParkInfo *park;
    uint32_t duration;

    if (kind == "fireworks") {
        type = EventType::FIREWORKS;
        park = ParkCatalog::findByKey("magic_kingdom");
        duration = Constants::Event::FIREWORKS_DEFAULT_DURATION_SEC;
    } else if (kind == "fireworks-epcot") {
        type = EventType::FIREWORKS;
        park = ParkCatalog::findByKey("epcot");
        duration = Constants::Event::FIREWORKS_DEFAULT_DURATION_SEC;
    } else if (kind == "parade") {
        type = EventType::PARADE;
        park = ParkCatalog::findByKey("magic_kingdom");
        duration = Constants::Event::PARADE_DEFAULT_DURATION_SEC;
    } else {
        Logger::warn(Logger::Source::Scheduler, tag_, "Unknown test event: %s", kind.c_str());
        return false;
    }

    const auto started = now - std::chrono::seconds(1);

    events_.clear();
    events_.push_back(ScheduledEvent{type, park->name, park->eventSlug,
                                     TimeHelper::secondOfDay(started), duration});
    Logger::info(Logger::Source::Scheduler, tag_, "TEST MODE: %s animation active", kind.c_str());
    return true;
}
