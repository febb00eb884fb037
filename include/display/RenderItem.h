#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <variant>

#include "display/Freshness.h"
#include "display/Surface.h"
#include "display/Transition.h"
#include "events/ScheduledEvent.h"
#include "model/WaitTimesData.h"
#include "model/Weather.h"

/**
 * @brief Everything a painter needs besides the item itself.
 */
struct CardContext {
    size_t index{0};
    size_t count{0};
    FreshnessStatus freshness;
    std::optional<WeatherData> weather;
};

/** A single card at rest. */
struct CardFrame {
    DisplayItem item;
    CardContext context;
};

/** Two snapshot surfaces being blended. */
struct CrossfadeFrame {
    std::shared_ptr<const Surface> previous;
    std::shared_ptr<const Surface> next;
    double progress{0.0};
    TransitionType type{TransitionType::CROSSFADE};
};

/** Nothing to rotate. */
struct EmptyFrame {
    CardContext context;
};

/** A show is running. */
struct EventFrame {
    ScheduledEvent event;
    double elapsedSeconds{0.0};
};

/**
 * @brief What the screen should show right now.
 */
using RenderItem = std::variant<CardFrame, CrossfadeFrame, EmptyFrame, EventFrame>;
