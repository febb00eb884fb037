#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "animation/ShowAnimator.h"
#include "display/CardPainter.h"
#include "display/DisplaySink.h"
#include "display/DisplayState.h"
#include "display/RenderItem.h"
#include "display/Transition.h"
#include "events/EventScheduler.h"
#include "model/WaitTimesData.h"
#include "model/Weather.h"
#include "utils/TimeHelper.h"

/**
 * @brief Decides what is on screen: ride rotation, closed-park notices,
 * the empty screen or a running show.
 *
 * Owns the card queue, the current index, the dwell timer, transition
 * progress and the active show. One mutex guards all of it:
 * setDisplaySnapshot() and reportFetchFailure() are called from the
 * refresh thread, tick() and currentRenderItem() from the render loop.
 */
class RotationController : public DisplaySink {
public:
    using ClockFn = std::function<TimeHelper::TimePoint()>;

    struct Timing {
        double displayDuration{8.0};    ///< seconds per card
        double transitionDuration{0.5}; ///< seconds per transition
        TransitionType transition{TransitionType::CROSSFADE};
    };

    RotationController(const EventScheduler &scheduler, CardPainter &painter, ShowAnimator &animator,
                       Timing timing, ClockFn clock = TimeHelper::Clock::now);

    RotationController(const RotationController &) = delete;
    RotationController &operator=(const RotationController &) = delete;

    /**
     * @brief Publish a new successful snapshot.
     *
     * The queue is built before the lock is taken; under the lock it is
     * swapped in, the fetch error is cleared and an out-of-range index
     * is reset to 0. Timers and an in-flight transition are kept.
     */
    void setDisplaySnapshot(std::shared_ptr<const WaitTimesData> data) override;

    /**
     * @brief Record a failed fetch; the current queue stays on screen.
     */
    void reportFetchFailure(const std::string &message) override;

    void setWeather(std::optional<WeatherData> weather) override;

    /**
     * @brief Advance the state machine by dt seconds.
     */
    void tick(double dt);

    /**
     * @brief Force the next transition (keyboard skip). Ignored during shows.
     */
    void skip();

    RenderItem currentRenderItem() const;

    DisplayState state() const;

    size_t currentIndex() const;
    size_t queueSize() const;
    double dwellSeconds() const;
    double transitionProgress() const;
    std::string lastError() const;
    std::optional<ScheduledEvent> activeEvent() const;

private:
    static constexpr auto tag_{"Rotation"};

    const EventScheduler &scheduler_;
    CardPainter &painter_;
    ShowAnimator &animator_;
    Timing timing_;
    ClockFn clock_;

    mutable std::mutex mutex_;

    std::shared_ptr<const std::vector<DisplayItem>> queue_;
    std::optional<TimeHelper::TimePoint> lastFetch_;
    std::string error_;
    std::optional<WeatherData> weather_;

    size_t index_{0};
    double dwell_{0.0};
    bool transitioning_{false};
    double progress_{0.0};
    std::shared_ptr<const Surface> previous_;
    std::shared_ptr<const Surface> next_;

    std::optional<ScheduledEvent> activeEvent_;
    TimeHelper::TimePoint eventStart_{};

    DisplayState loggedState_{DisplayState::EMPTY};

    // All helpers below expect mutex_ to be held
    DisplayState stateLocked() const;
    CardContext contextLocked(TimeHelper::TimePoint now) const;
    void startTransitionLocked(TimeHelper::TimePoint now);
    void logStateLocked();
};
