#pragma once

#include <string>

#include "display/Surface.h"

/**
 * @brief Card-to-card transition effect.
 */
enum class TransitionType {
    CROSSFADE,
    SLIDE_LEFT
};

constexpr const char *toString(TransitionType type) {
    switch (type) {
        case TransitionType::CROSSFADE: return "crossfade";
        case TransitionType::SLIDE_LEFT: return "slide_left";
        default: return "UNKNOWN";
    }
}

namespace Transition {
    /**
     * @brief Compose one transition frame.
     * @param prev Outgoing card
     * @param next Incoming card
     * @param progress 0.0 (all prev) to 1.0 (all next)
     * @param target Output surface, same size as the cards
     */
    using Fn = void (*)(const Surface &prev, const Surface &next, double progress, Surface &target);

    void crossfade(const Surface &prev, const Surface &next, double progress, Surface &target);

    void slideLeft(const Surface &prev, const Surface &next, double progress, Surface &target);

    /** Quadratic ease-in-out on [0, 1]. */
    double easeInOut(double t);

    /**
     * @brief Effect for a tag; unknown tags fall back to crossfade.
     */
    Fn lookup(TransitionType type);

    /**
     * @brief Parse a configuration name ("crossfade", "slide_left").
     * @return CROSSFADE for unknown names
     */
    TransitionType parse(const std::string &name);
}
