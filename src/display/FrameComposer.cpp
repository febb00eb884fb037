#include "display/FrameComposer.h"
#include "logging/Logger.h"

#include <exception>
#include <type_traits>

FrameComposer::FrameComposer(CardPainter &painter, ShowAnimator &animator)
    : painter_{painter}, animator_{animator} {
}

void FrameComposer::compose(const RenderItem &item, Surface &target) {
    try {
        std::visit([&](const auto &frame) {
            using T = std::decay_t<decltype(frame)>;
            if constexpr (std::is_same_v<T, CardFrame>) {
                target = paintOrPlaceholder(painter_, frame.item, frame.context);
            } else if constexpr (std::is_same_v<T, CrossfadeFrame>) {
                Transition::lookup(frame.type)(*frame.previous, *frame.next, frame.progress, target);
            } else if constexpr (std::is_same_v<T, EmptyFrame>) {
                target = painter_.paintEmpty(frame.context);
            } else {
                target.fill(SHOW_BACKGROUND);
                animator_.render(target);
            }
        }, item);
    } catch (const std::exception &e) {
        Logger::error(Logger::Source::Display, tag_, "Render error: %s", e.what());
        target = errorPlaceholder(painter_.width(), painter_.height());
    }
}
