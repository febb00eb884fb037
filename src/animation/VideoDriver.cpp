#include "animation/VideoDriver.h"

VideoDriver::VideoDriver(std::unique_ptr<FrameSource> source)
    : source_{std::move(source)},
      frameDuration_{1.0 / (source_ && source_->fps() > 0.0 ? source_->fps() : FrameSequenceSource::DEFAULT_FPS)} {
}

void VideoDriver::readNextFrame() {
    if (!source_) {
        return;
    }
    if (!source_->readNext(current_)) {
        source_->rewind();
        if (!source_->readNext(current_)) {
            return;
        }
    }
    ++framesShown_;
}

void VideoDriver::reset() {
    framesShown_ = 0;
    lastFrameTime_ = 0.0;
    if (source_) {
        source_->rewind();
    }
    readNextFrame();
}

void VideoDriver::update(double, double elapsed) {
    if (elapsed - lastFrameTime_ >= frameDuration_) {
        readNextFrame();
        lastFrameTime_ = elapsed;
    }
}

void VideoDriver::render(Surface &surface) const {
    if (!current_.empty()) {
        surface.blit(current_, 0, 0);
    }
}
