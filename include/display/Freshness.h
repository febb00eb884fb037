#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/Constants.h"
#include "display/Surface.h"
#include "utils/TimeHelper.h"

/**
 * @brief Age and status-badge state of the displayed data.
 */
struct FreshnessStatus {
    enum class Badge {
        NONE,
        WARNING, ///< Data is old
        ERROR    ///< Last fetch attempt failed
    };

    int64_t ageMinutes{-1}; ///< -1 when no fetch time is known
    bool isStale{true};
    Badge badge{Badge::NONE};
    std::string label;      ///< "<n>m", or "!" when age is not positive

    bool showBadge() const { return badge != Badge::NONE; }
};

namespace Freshness {
    constexpr Color WARNING_COLOR{255, 193, 7};
    constexpr Color ERROR_COLOR{220, 53, 69};

    /**
     * @brief Derive freshness from the last successful fetch.
     * @param lastFetch Time of the last successful fetch, if any
     * @param now Current time
     * @param hasError Whether the most recent attempt failed
     */
    inline FreshnessStatus evaluate(const std::optional<TimeHelper::TimePoint> &lastFetch,
                                    TimeHelper::TimePoint now, bool hasError) {
        FreshnessStatus status;
        if (lastFetch) {
            const double age = TimeHelper::elapsedSeconds(*lastFetch, now);
            status.ageMinutes = static_cast<int64_t>(age / 60.0);
            status.isStale = age > static_cast<double>(Constants::Freshness::STALE_AFTER_SEC);
        }

        if (hasError) {
            status.badge = FreshnessStatus::Badge::ERROR;
        } else if (status.ageMinutes > Constants::Freshness::BADGE_AFTER_MINUTES) {
            status.badge = FreshnessStatus::Badge::WARNING;
        }

        if (status.showBadge()) {
            status.label = status.ageMinutes > 0 ? std::to_string(status.ageMinutes) + "m" : "!";
        }
        return status;
    }

    inline Color badgeColor(FreshnessStatus::Badge badge) {
        return badge == FreshnessStatus::Badge::ERROR ? ERROR_COLOR : WARNING_COLOR;
    }
}
