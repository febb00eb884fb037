#include "display/CardPainter.h"
#include "display/Freshness.h"
#include "logging/Logger.h"

#include <exception>

namespace {
    constexpr auto tag = "CardPainter";

    struct PaintVisitor {
        CardPainter &painter;
        const CardContext &context;

        Surface operator()(const Ride &ride) const { return painter.paintRide(ride, context); }

        Surface operator()(const ClosedPark &park) const { return painter.paintClosedPark(park, context); }
    };
}

Surface errorPlaceholder(int width, int height) {
    Surface surface(width, height, Color{30, 0, 0});
    const int barHeight = height / 6;
    surface.fillRect(0, (height - barHeight) / 2, width, barHeight, Freshness::ERROR_COLOR, 160);
    return surface;
}

Surface paintOrPlaceholder(CardPainter &painter, const DisplayItem &item, const CardContext &context) {
    try {
        return std::visit(PaintVisitor{painter, context}, item);
    } catch (const std::exception &e) {
        Logger::error(Logger::Source::Display, tag, "Render error: %s", e.what());
        return errorPlaceholder(painter.width(), painter.height());
    }
}
