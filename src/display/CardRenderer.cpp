#include "display/CardRenderer.h"
#include "core/Constants.h"
#include "core/Flags.h"
#include "display/Freshness.h"

#include <string>

namespace {
    constexpr Color CLOSED_COLOR{231, 76, 60};
    constexpr Color WHITE{255, 255, 255};
    constexpr Color BLACK{0, 0, 0};
    constexpr int ACCENT_LINE{3};
    constexpr int CLOSED_BAR_HEIGHT{140};
    constexpr int NAME_MARGIN{40};
    constexpr size_t MIN_TRUNCATED_LENGTH{10};

    namespace FontSize {
        constexpr int HEADLINE{80};
        constexpr int NAME{36};
        constexpr int OPENS_AT{28};
        constexpr int MESSAGE{38};
        constexpr int SUB_MESSAGE{26};
        constexpr int SMALL{22};
    }

    // Drop whole UTF-8 sequences from the end
    void popCodepoint(std::string &s) {
        while (!s.empty()) {
            const auto c = static_cast<unsigned char>(s.back());
            s.pop_back();
            if ((c & 0xC0) != 0x80) break;
        }
    }

    size_t codepointCount(const std::string &s) {
        size_t n = 0;
        for (unsigned char c : s) {
            if ((c & 0xC0) != 0x80) ++n;
        }
        return n;
    }

    Color weatherTint(const std::string &condition) {
        if (condition == "Clear") return Color{255, 200, 60};
        if (condition == "Rain" || condition == "Drizzle") return Color{80, 140, 220};
        if (condition == "Thunderstorm") return Color{150, 110, 200};
        return Color{190, 190, 190};
    }
}

CardRenderer::CardRenderer(ImageLibrary &images, TextRenderer &text, int width, int height)
    : images_{images}, text_{text}, width_{width}, height_{height} {
}

std::string CardRenderer::fitText(const std::string &text, int maxWidth, int pixelSize,
                                  const std::string &theme) const {
    std::string fitted = text;
    while (text_.textWidth(fitted, pixelSize, theme) > maxWidth && codepointCount(fitted) > MIN_TRUNCATED_LENGTH) {
        for (int i = 0; i < 4; ++i) {
            popCodepoint(fitted);
        }
        fitted += "...";
    }
    return fitted;
}

void CardRenderer::drawCentered(Surface &surface, const std::string &text, int y, int pixelSize, Color color,
                                const std::string &theme) const {
    const int w = text_.textWidth(text, pixelSize, theme);
    text_.drawText(surface, text, (width_ - w) / 2, y, pixelSize, color, theme);
}

Surface CardRenderer::paintRide(const Ride &ride, const CardContext &context) {
    const std::string theme = ThemeCatalog::themeForRide(ride.name);
    const ColorScheme &colors = ThemeCatalog::colorScheme(theme);

    Surface surface(width_, height_);
    surface.blit(images_.rideImage(ride.name, theme), 0, 0);

    const int barHeight = Constants::Layout::BOTTOM_BAR_HEIGHT;
    const int barY = height_ - barHeight - 10;
    drawBottomBar(surface, barHeight, colors);

    drawCentered(surface, ride.displayWait(), barY + 10, FontSize::HEADLINE,
                 ThemeCatalog::waitColor(ride.waitCategory()), theme);
    drawCentered(surface, fitText(ride.name, width_ - NAME_MARGIN, FontSize::NAME, theme), barY + 90,
                 FontSize::NAME, colors.textPrimary, theme);

    drawDots(surface, context, colors);
    drawStatusBadge(surface, context);
    drawWeather(surface, context);
    return surface;
}

Surface CardRenderer::paintClosedPark(const ClosedPark &park, const CardContext &context) {
    const std::string theme = ThemeCatalog::DEFAULT_THEME;
    const ColorScheme &colors = ThemeCatalog::colorScheme(theme);

    Surface surface(width_, height_);
    if (const Surface *image = images_.parkImage(park.slug)) {
        surface.blit(*image, 0, 0);
    } else {
        surface.blit(images_.gradient(ThemeCatalog::DEFAULT_THEME), 0, 0);
    }

    const int barY = height_ - CLOSED_BAR_HEIGHT - 10;
    drawBottomBar(surface, CLOSED_BAR_HEIGHT, colors);
    drawCentered(surface, "CLOSED", barY + 10, FontSize::HEADLINE, CLOSED_COLOR, theme);
    drawCentered(surface, park.name, barY + 85, FontSize::NAME, colors.textPrimary, theme);
    if (!park.opensAt.empty()) {
        drawCentered(surface, "Opens at " + park.opensAt, barY + 115, FontSize::OPENS_AT, colors.accent, theme);
    }

    drawDots(surface, context, colors);
    drawStatusBadge(surface, context);
    drawWeather(surface, context);
    return surface;
}

Surface CardRenderer::paintEmpty(const CardContext &context) {
    const ColorScheme &colors = ThemeCatalog::colorScheme(ThemeCatalog::DEFAULT_THEME);
    Surface surface = images_.gradient(ThemeCatalog::DEFAULT_THEME);

    const int mid = height_ / 2;
    drawCentered(surface, "No rides currently reporting wait times", mid - FontSize::MESSAGE / 2,
                 FontSize::MESSAGE, colors.textSecondary, "fantasy");
    drawCentered(surface, "Parks may be closed", mid + 50 - FontSize::SUB_MESSAGE / 2, FontSize::SUB_MESSAGE,
                 colors.accent, ThemeCatalog::DEFAULT_THEME);
    if (context.freshness.ageMinutes >= 0) {
        drawCentered(surface, "Last updated: " + std::to_string(context.freshness.ageMinutes) + " minutes ago",
                     mid + 100 - FontSize::SMALL / 2, FontSize::SMALL, colors.textSecondary,
                     ThemeCatalog::DEFAULT_THEME);
    }

    drawStatusBadge(surface, context);
    drawWeather(surface, context);
    return surface;
}

void CardRenderer::advanceImageCycles() {
    images_.advanceAllCycles();
}

void CardRenderer::drawBottomBar(Surface &surface, int barHeight, const ColorScheme &colors) const {
    const int barY = height_ - barHeight - 10;
    surface.fillRect(0, barY, width_, barHeight, colors.background, Constants::Layout::BOTTOM_BAR_ALPHA);
    surface.fillRect(0, barY, width_, ACCENT_LINE, colors.accent);
}

std::pair<size_t, size_t> CardRenderer::dotWindow(size_t index, size_t count, size_t maxDots) {
    if (count <= maxDots) {
        return {0, count};
    }
    const size_t half = maxDots / 2;
    if (index < half) {
        return {0, maxDots};
    }
    if (index >= count - half) {
        return {count - maxDots, maxDots};
    }
    return {index - half, maxDots};
}

void CardRenderer::drawDots(Surface &surface, const CardContext &context, const ColorScheme &colors) const {
    if (context.count == 0) {
        return;
    }
    const auto [first, visible] = dotWindow(context.index, context.count, Flags::Display::MAX_PROGRESS_DOTS);
    const int spacing = Constants::Layout::DOT_SPACING;
    const int radius = Constants::Layout::DOT_RADIUS;
    const int y = height_ - Constants::Layout::DOT_Y_FROM_BOTTOM;
    const int startX = (width_ - static_cast<int>(visible - 1) * spacing) / 2;

    for (size_t i = 0; i < visible; ++i) {
        const int x = startX + static_cast<int>(i) * spacing;
        if (first + i == context.index) {
            surface.fillCircle(x, y, radius + 2, WHITE);
            surface.fillCircle(x, y, radius, colors.accent);
        } else {
            surface.fillCircle(x, y, radius, WHITE, 120);
        }
    }
}

void CardRenderer::drawStatusBadge(Surface &surface, const CardContext &context) const {
    if (!context.freshness.showBadge()) {
        return;
    }
    const int cx = width_ - Constants::Layout::BOX_MARGIN - 15;
    const int cy = Constants::Layout::BOX_MARGIN + 15;
    surface.fillRect(cx - 30, cy - 15, 60, 30, Freshness::badgeColor(context.freshness.badge), 200);

    const std::string &label = context.freshness.label;
    const int w = text_.textWidth(label, FontSize::SMALL, ThemeCatalog::DEFAULT_THEME);
    text_.drawText(surface, label, cx - w / 2, cy - FontSize::SMALL / 2, FontSize::SMALL, BLACK,
                   ThemeCatalog::DEFAULT_THEME);
}

void CardRenderer::drawWeather(Surface &surface, const CardContext &context) const {
    if (!context.weather) {
        return;
    }
    const int r = Constants::Layout::BADGE_RADIUS;
    const int c = Constants::Layout::BOX_MARGIN + r;
    surface.fillCircle(c, c, r, weatherTint(context.weather->condition), 220);
    text_.drawText(surface, context.weather->tempDisplay(), c + r + 8, c - FontSize::SMALL / 2, FontSize::SMALL,
                   WHITE, ThemeCatalog::DEFAULT_THEME);
}
