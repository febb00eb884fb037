#include "display/Transition.h"

#include <algorithm>
#include <cmath>

namespace Transition {
    void crossfade(const Surface &prev, const Surface &next, double progress, Surface &target) {
        const double p = std::clamp(progress, 0.0, 1.0);
        target.blit(prev, 0, 0);
        target.blit(next, 0, 0, static_cast<int>(255 * p));
    }

    void slideLeft(const Surface &prev, const Surface &next, double progress, Surface &target) {
        const double p = easeInOut(std::clamp(progress, 0.0, 1.0));
        const int offset = static_cast<int>(target.width() * p);
        target.blit(prev, -offset, 0);
        target.blit(next, target.width() - offset, 0);
    }

    double easeInOut(double t) {
        if (t < 0.5) {
            return 2 * t * t;
        }
        return 1 - std::pow(-2 * t + 2, 2) / 2;
    }

    Fn lookup(TransitionType type) {
        switch (type) {
            case TransitionType::SLIDE_LEFT: return slideLeft;
            case TransitionType::CROSSFADE:
            default: return crossfade;
        }
    }

    TransitionType parse(const std::string &name) {
        if (name == "slide_left") return TransitionType::SLIDE_LEFT;
        return TransitionType::CROSSFADE;
    }
}
