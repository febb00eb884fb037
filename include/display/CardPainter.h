#pragma once

#include <string>

#include "display/RenderItem.h"
#include "display/Surface.h"
#include "model/Park.h"
#include "model/Ride.h"

/**
 * @brief Turns display items into full-screen surfaces.
 *
 * Implementations may throw on asset or drawing failures; callers go
 * through paintOrPlaceholder() so one bad card never stops the loop.
 */
class CardPainter {
public:
    virtual ~CardPainter() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;

    virtual Surface paintRide(const Ride &ride, const CardContext &context) = 0;

    virtual Surface paintClosedPark(const ClosedPark &park, const CardContext &context) = 0;

    virtual Surface paintEmpty(const CardContext &context) = 0;

    /**
     * @brief Called each time the rotation wraps back to the first card.
     */
    virtual void advanceImageCycles() = 0;
};

/**
 * @brief Dark red screen shown in place of a card that failed to paint.
 */
Surface errorPlaceholder(int width, int height);

/**
 * @brief Paint an item, replacing failures with errorPlaceholder().
 *
 * Failures are logged at ERROR.
 */
Surface paintOrPlaceholder(CardPainter &painter, const DisplayItem &item, const CardContext &context);
