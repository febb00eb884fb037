#pragma once

#include <cstdint>
#include <string>

#include "core/Constants.h"

/**
 * @brief Wait-time band used to colour a ride card.
 */
enum class WaitCategory {
    SHORT,    ///< 0-20 min
    MODERATE, ///< 21-45 min
    LONG,     ///< 46-75 min
    VERY_LONG ///< 76+ min
};

constexpr const char *toString(WaitCategory category) {
    switch (category) {
        case WaitCategory::SHORT: return "short";
        case WaitCategory::MODERATE: return "moderate";
        case WaitCategory::LONG: return "long";
        case WaitCategory::VERY_LONG: return "very_long";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Band for a wait time in minutes.
 */
constexpr WaitCategory waitCategoryFor(uint32_t waitMinutes) {
    if (waitMinutes <= Constants::Wait::SHORT_MAX) return WaitCategory::SHORT;
    if (waitMinutes <= Constants::Wait::MODERATE_MAX) return WaitCategory::MODERATE;
    if (waitMinutes <= Constants::Wait::LONG_WAIT_MAX) return WaitCategory::LONG;
    return WaitCategory::VERY_LONG;
}

/**
 * @brief One attraction as reported by the wait-time API.
 */
struct Ride {
    uint32_t id{0};
    std::string name;
    uint32_t waitTime{0}; ///< minutes
    bool isOpen{false};
    uint32_t parkId{0};
    std::string parkName;

    WaitCategory waitCategory() const { return waitCategoryFor(waitTime); }

    /**
     * @brief Wait text shown on the card: "Closed", "Walk On" or "<n> min".
     */
    std::string displayWait() const {
        if (!isOpen) return "Closed";
        if (waitTime == 0) return "Walk On";
        return std::to_string(waitTime) + " min";
    }
};
