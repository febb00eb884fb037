#pragma once

#include <cstdint>
#include <memory>

#include "animation/AnimationDriver.h"
#include "animation/FrameSource.h"

/**
 * @brief Plays a FrameSource at its native rate, looping at end of stream.
 */
class VideoDriver : public AnimationDriver {
public:
    explicit VideoDriver(std::unique_ptr<FrameSource> source);

    void reset() override;
    void update(double dt, double elapsed) override;
    void render(Surface &surface) const override;

    /** Frames decoded since the last reset(), including the first. */
    uint64_t framesShown() const { return framesShown_; }

private:
    std::unique_ptr<FrameSource> source_;
    double frameDuration_;
    double lastFrameTime_{0.0};
    Surface current_;
    uint64_t framesShown_{0};

    void readNextFrame();
};
