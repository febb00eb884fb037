#include "animation/EventAnimator.h"
#include "logging/Logger.h"

EventAnimator::EventAnimator(int width, int height, const VideoCatalog *catalog, uint32_t seed)
    : catalog_{catalog}, fireworks_{width, height, seed}, parade_{width, height, seed + 1} {
}

AnimationDriver *EventAnimator::proceduralDriver() {
    if (!event_) {
        return nullptr;
    }
    switch (event_->type) {
        case EventType::FIREWORKS: return &fireworks_;
        case EventType::PARADE: return &parade_;
        default: return nullptr;
    }
}

void EventAnimator::begin(const ScheduledEvent &event) {
    event_ = event;
    video_.reset();
    if (AnimationDriver *driver = proceduralDriver()) {
        driver->reset();
    }
}

void EventAnimator::refreshVideo() {
    const std::string key = event_->videoKey();
    const bool available = catalog_ && catalog_->available(key);

    if (!available) {
        if (video_) {
            Logger::info(Logger::Source::Display, tag_, "Video %s gone, using procedural show", key.c_str());
            video_.reset();
        }
        return;
    }
    if (video_) {
        return;
    }
    if (auto source = catalog_->open(key)) {
        video_ = std::make_unique<VideoDriver>(std::move(source));
        video_->reset();
    }
}

void EventAnimator::update(double dt, double elapsed) {
    if (!event_) {
        return;
    }
    refreshVideo();
    if (video_) {
        video_->update(dt, elapsed);
    } else if (AnimationDriver *driver = proceduralDriver()) {
        driver->update(dt, elapsed);
    }
}

void EventAnimator::render(Surface &surface) {
    if (video_) {
        video_->render(surface);
    } else if (AnimationDriver *driver = proceduralDriver()) {
        driver->render(surface);
    }
}

void EventAnimator::end() {
    event_.reset();
    video_.reset();
}

const char *EventAnimator::activeDriverName() const {
    if (!event_) return "none";
    if (video_) return "video";
    return toString(event_->type);
}
