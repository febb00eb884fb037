#pragma once

#include "animation/ShowAnimator.h"
#include "display/CardPainter.h"
#include "display/RenderItem.h"
#include "display/Surface.h"

/**
 * @brief Turns the controller's RenderItem into the frame that goes to the screen.
 *
 * Runs on the render thread only. Drawing failures are logged and the
 * error placeholder is shown instead.
 */
class FrameComposer {
public:
    FrameComposer(CardPainter &painter, ShowAnimator &animator);

    void compose(const RenderItem &item, Surface &target);

private:
    static constexpr auto tag_{"Composer"};
    static constexpr Color SHOW_BACKGROUND{10, 10, 30};

    CardPainter &painter_;
    ShowAnimator &animator_;
};
