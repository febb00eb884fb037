#include "display/RotationController.h"
#include "display/Freshness.h"
#include "logging/Logger.h"

#include <utility>

RotationController::RotationController(const EventScheduler &scheduler, CardPainter &painter,
                                       ShowAnimator &animator, Timing timing, ClockFn clock)
    : scheduler_{scheduler}, painter_{painter}, animator_{animator}, timing_{timing},
      clock_{std::move(clock)}, queue_{std::make_shared<const std::vector<DisplayItem>>()} {
}

void RotationController::setDisplaySnapshot(std::shared_ptr<const WaitTimesData> data) {
    if (!data) {
        return;
    }
    auto queue = std::make_shared<const std::vector<DisplayItem>>(buildDisplayQueue(*data));
    const size_t rides = data->allOpenRides().size();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_ = std::move(queue);
        lastFetch_ = data->lastFetch;
        error_.clear();
        if (index_ >= queue_->size()) {
            index_ = 0;
        }
        Logger::info(Logger::Source::Display, tag_, "Display updated with %zu rides, %zu closed parks",
                     rides, queue_->size() - rides);
        logStateLocked();
    }
}

void RotationController::reportFetchFailure(const std::string &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = message.empty() ? "Fetch failed" : message;
}

void RotationController::setWeather(std::optional<WeatherData> weather) {
    std::lock_guard<std::mutex> lock(mutex_);
    weather_ = std::move(weather);
}

void RotationController::tick(double dt) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();

    auto active = scheduler_.activeEvent(now);
    if (active) {
        if (!activeEvent_ || *activeEvent_ != *active) {
            Logger::info(Logger::Source::Display, tag_, "Show started: %s %s",
                         active->parkName.c_str(), toString(active->type));
            activeEvent_ = active;
            eventStart_ = now;
            animator_.begin(*active);
        }
        animator_.update(dt, TimeHelper::elapsedSeconds(eventStart_, now));
        logStateLocked();
        return;
    }

    if (activeEvent_) {
        Logger::info(Logger::Source::Display, tag_, "Show ended: %s %s",
                     activeEvent_->parkName.c_str(), toString(activeEvent_->type));
        activeEvent_.reset();
        animator_.end();
    }

    if (queue_->empty()) {
        transitioning_ = false;
        progress_ = 0.0;
        previous_.reset();
        next_.reset();
        logStateLocked();
        return;
    }

    if (transitioning_) {
        progress_ += dt / timing_.transitionDuration;
        if (progress_ >= 1.0) {
            transitioning_ = false;
            progress_ = 0.0;
            previous_.reset();
            next_.reset();
        }
    } else {
        dwell_ += dt;
        if (dwell_ >= timing_.displayDuration) {
            dwell_ = 0.0;
            startTransitionLocked(now);
        }
    }
    logStateLocked();
}

void RotationController::skip() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeEvent_ || queue_->empty()) {
        return;
    }
    dwell_ = 0.0;
    startTransitionLocked(clock_());
    logStateLocked();
}

void RotationController::startTransitionLocked(TimeHelper::TimePoint now) {
    const auto &queue = *queue_;
    if (queue.size() <= 1) {
        return;
    }

    CardContext context = contextLocked(now);
    auto previous = std::make_shared<const Surface>(paintOrPlaceholder(painter_, queue[index_], context));

    index_ = (index_ + 1) % queue.size();
    if (index_ == 0) {
        painter_.advanceImageCycles();
    }

    context.index = index_;
    auto next = std::make_shared<const Surface>(paintOrPlaceholder(painter_, queue[index_], context));

    previous_ = std::move(previous);
    next_ = std::move(next);
    transitioning_ = true;
    progress_ = 0.0;
}

CardContext RotationController::contextLocked(TimeHelper::TimePoint now) const {
    CardContext context;
    context.index = index_;
    context.count = queue_->size();
    context.freshness = Freshness::evaluate(lastFetch_, now, !error_.empty());
    context.weather = weather_;
    return context;
}

DisplayState RotationController::stateLocked() const {
    if (activeEvent_) return DisplayState::EVENT_ACTIVE;
    if (queue_->empty()) return DisplayState::EMPTY;
    if (transitioning_) return DisplayState::TRANSITIONING;
    return DisplayState::NORMAL_ROTATION;
}

void RotationController::logStateLocked() {
    const DisplayState current = stateLocked();
    if (current == loggedState_) {
        return;
    }
    // Card-to-card transitions are too frequent for INFO
    if (current == DisplayState::TRANSITIONING || loggedState_ == DisplayState::TRANSITIONING) {
        Logger::debug(Logger::Source::Display, tag_, "%s -> %s", toString(loggedState_), toString(current));
    } else {
        Logger::stateChange(Logger::Source::Display, tag_, toString(loggedState_), toString(current));
    }
    loggedState_ = current;
}

RenderItem RotationController::currentRenderItem() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();

    switch (stateLocked()) {
        case DisplayState::EVENT_ACTIVE:
            return EventFrame{*activeEvent_, TimeHelper::elapsedSeconds(eventStart_, now)};
        case DisplayState::EMPTY:
            return EmptyFrame{contextLocked(now)};
        case DisplayState::TRANSITIONING:
            if (previous_ && next_) {
                return CrossfadeFrame{previous_, next_, progress_, timing_.transition};
            }
            break;
        default:
            break;
    }
    return CardFrame{(*queue_)[index_], contextLocked(now)};
}

DisplayState RotationController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stateLocked();
}

size_t RotationController::currentIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_;
}

size_t RotationController::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_->size();
}

double RotationController::dwellSeconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dwell_;
}

double RotationController::transitionProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::string RotationController::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::optional<ScheduledEvent> RotationController::activeEvent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeEvent_;
}
