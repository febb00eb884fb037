#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "display/CardPainter.h"
#include "display/ImageLibrary.h"
#include "display/TextRenderer.h"
#include "display/ThemeCatalog.h"

/**
 * @brief Paints ride, closed-park and empty cards from the image library.
 *
 * Layout: full-screen artwork, a translucent bottom bar with an accent
 * line, the wait (or CLOSED) in large type over the ride or park name,
 * navigation dots, the weather badge and the freshness badge with the
 * data age.
 */
class CardRenderer : public CardPainter {
public:
    CardRenderer(ImageLibrary &images, TextRenderer &text, int width, int height);

    int width() const override { return width_; }
    int height() const override { return height_; }

    Surface paintRide(const Ride &ride, const CardContext &context) override;

    Surface paintClosedPark(const ClosedPark &park, const CardContext &context) override;

    Surface paintEmpty(const CardContext &context) override;

    void advanceImageCycles() override;

    /**
     * @brief Which queue positions the dot row shows.
     * @param index Current card
     * @param count Queue length
     * @param maxDots Maximum dots on screen
     * @return (first queue index shown, number of dots)
     *
     * With more cards than dots the window is centred on index and
     * clamped to the ends of the queue.
     */
    static std::pair<size_t, size_t> dotWindow(size_t index, size_t count, size_t maxDots);

    /**
     * @brief Shorten text with "..." until it fits maxWidth.
     *
     * Stops at ten characters even if the result is still too wide.
     */
    std::string fitText(const std::string &text, int maxWidth, int pixelSize, const std::string &theme) const;

private:
    ImageLibrary &images_;
    TextRenderer &text_;
    int width_;
    int height_;

    void drawCentered(Surface &surface, const std::string &text, int y, int pixelSize, Color color,
                      const std::string &theme) const;

    void drawBottomBar(Surface &surface, int barHeight, const ColorScheme &colors) const;
    void drawDots(Surface &surface, const CardContext &context, const ColorScheme &colors) const;
    void drawStatusBadge(Surface &surface, const CardContext &context) const;
    void drawWeather(Surface &surface, const CardContext &context) const;
};
