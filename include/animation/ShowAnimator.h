#pragma once

#include "display/Surface.h"
#include "events/ScheduledEvent.h"

/**
 * @brief Plays the animation for whichever show is active.
 *
 * The rotation controller calls begin() on the tick a show becomes
 * active, update() on every tick while it stays active and end() on
 * the first tick after it finishes.
 */
class ShowAnimator {
public:
    virtual ~ShowAnimator() = default;

    /** Reset the drivers for this show. */
    virtual void begin(const ScheduledEvent &event) = 0;

    /**
     * @param dt Seconds since the previous tick
     * @param elapsed Seconds since the show was first seen active
     */
    virtual void update(double dt, double elapsed) = 0;

    virtual void render(Surface &surface) = 0;

    virtual void end() = 0;
};
