#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <cstdio>
#include <string>

/**
 * Helpers for wall-clock time in the kiosk's local timezone.
 * Show schedules are local times of day, so every calendar
 * calculation goes through localtime_r/mktime.
 */
namespace TimeHelper {
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    /**
     * Break a time point into local calendar fields.
     */
    inline struct tm toLocal(TimePoint tp) {
        time_t t = Clock::to_time_t(tp);
        struct tm local{};
        localtime_r(&t, &local);
        return local;
    }

    /**
     * Time point for hour:minute on the same local day as tp.
     */
    inline TimePoint atTimeOfDay(TimePoint tp, uint32_t hour, uint32_t minute) {
        struct tm local = toLocal(tp);
        local.tm_hour = static_cast<int>(hour);
        local.tm_min = static_cast<int>(minute);
        local.tm_sec = 0;
        local.tm_isdst = -1;
        return Clock::from_time_t(mktime(&local));
    }

    /**
     * Wall-clock time secondOfDay seconds past local midnight on the day of tp.
     * Built from calendar fields, so a DST change earlier that day does not shift it.
     */
    inline TimePoint atSecondOfDay(TimePoint tp, uint32_t secondOfDay) {
        struct tm local = toLocal(tp);
        local.tm_hour = static_cast<int>(secondOfDay / 3600);
        local.tm_min = static_cast<int>((secondOfDay % 3600) / 60);
        local.tm_sec = static_cast<int>(secondOfDay % 60);
        local.tm_isdst = -1;
        return Clock::from_time_t(mktime(&local));
    }

    /**
     * Local wall-clock seconds since midnight (0..86399).
     */
    inline uint32_t secondOfDay(TimePoint tp) {
        struct tm local = toLocal(tp);
        return static_cast<uint32_t>(local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec);
    }

    /**
     * Same wall-clock time one calendar day later.
     */
    inline TimePoint nextDay(TimePoint tp) {
        struct tm local = toLocal(tp);
        local.tm_mday += 1;
        local.tm_isdst = -1;
        return Clock::from_time_t(mktime(&local));
    }

    /**
     * Whole seconds between two time points (b - a), may be negative.
     */
    inline int64_t secondsBetween(TimePoint a, TimePoint b) {
        return std::chrono::duration_cast<std::chrono::seconds>(b - a).count();
    }

    /**
     * Fractional seconds between two time points (b - a).
     */
    inline double elapsedSeconds(TimePoint a, TimePoint b) {
        return std::chrono::duration<double>(b - a).count();
    }

    /**
     * Format as "09:05 PM".
     */
    inline std::string formatClock12(TimePoint tp) {
        struct tm local = toLocal(tp);
        char buf[16];
        strftime(buf, sizeof(buf), "%I:%M %p", &local);
        return buf;
    }

    /**
     * Format as "YYYY-MM-DD HH:MM:SS" (database timestamps).
     */
    inline std::string formatTimestamp(TimePoint tp) {
        struct tm local = toLocal(tp);
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
        return buf;
    }

    /**
     * Format hour/minute as "HH:MM".
     */
    inline std::string formatHourMinute(uint32_t hour, uint32_t minute) {
        char buf[8];
        snprintf(buf, sizeof(buf), "%02u:%02u", hour % 24, minute % 60);
        return buf;
    }
}
