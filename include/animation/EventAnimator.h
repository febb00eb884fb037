#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <random>

#include "animation/FireworksDriver.h"
#include "animation/FrameSource.h"
#include "animation/ParadeDriver.h"
#include "animation/ShowAnimator.h"
#include "animation/VideoDriver.h"

/**
 * @brief Chooses between a recorded video and the procedural drivers.
 *
 * On every update the catalog is asked whether a video exists for the
 * show's key; while one does it is played, otherwise the fireworks or
 * parade driver runs. A video appearing or disappearing mid-show takes
 * effect on the next update.
 */
class EventAnimator : public ShowAnimator {
public:
    /**
     * @param catalog May be null: procedural drivers only
     */
    EventAnimator(int width, int height, const VideoCatalog *catalog,
                  uint32_t seed = std::random_device{}());

    void begin(const ScheduledEvent &event) override;
    void update(double dt, double elapsed) override;
    void render(Surface &surface) override;
    void end() override;

    /** "video", "fireworks", "parade" or "none". */
    const char *activeDriverName() const;

    const FireworksDriver &fireworks() const { return fireworks_; }
    const ParadeDriver &parade() const { return parade_; }

private:
    static constexpr auto tag_{"Animator"};

    const VideoCatalog *catalog_;
    FireworksDriver fireworks_;
    ParadeDriver parade_;
    std::unique_ptr<VideoDriver> video_;
    std::optional<ScheduledEvent> event_;

    AnimationDriver *proceduralDriver();
    void refreshVideo();
};
