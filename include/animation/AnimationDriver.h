#pragma once

#include "display/Surface.h"

/**
 * @brief One procedural or recorded show animation.
 *
 * update() advances the simulation, render() draws the current frame on
 * top of whatever the surface already holds.
 */
class AnimationDriver {
public:
    virtual ~AnimationDriver() = default;

    virtual void reset() = 0;

    /**
     * @param dt Seconds since the previous update
     * @param elapsed Seconds since the show started
     */
    virtual void update(double dt, double elapsed) = 0;

    virtual void render(Surface &surface) const = 0;
};
