#pragma once

#include <cstdint>

/**
 * @brief Fixed constants of the kiosk.
 * These values are part of the observable behaviour and are not configurable.
 */
namespace Constants {
    namespace Wait {
        constexpr uint32_t SHORT_MAX{20};    // 0-20 min
        constexpr uint32_t MODERATE_MAX{45}; // 21-45 min
        constexpr uint32_t LONG_WAIT_MAX{75};     // 46-75 min, above is very long
    }

    namespace Freshness {
        constexpr int64_t STALE_AFTER_SEC{900};    // 15 minutes
        constexpr int64_t BADGE_AFTER_MINUTES{10}; // badge shown once data is older
    }

    namespace Event {
        constexpr uint32_t FIREWORKS_DEFAULT_DURATION_SEC{240};
        constexpr uint32_t PARADE_DEFAULT_DURATION_SEC{120};
        constexpr uint32_t SECONDS_PER_DAY{24 * 3600};
    }

    namespace Refresh {
        constexpr uint32_t MAX_CONSECUTIVE_FAILURES{5}; // escalate logging after this many
    }

    namespace Park {
        constexpr const char *DEFAULT_OPENS_AT{"9:00 AM"};
    }

    namespace Layout {
        constexpr int BOX_MARGIN{30};
        constexpr int BOTTOM_BAR_HEIGHT{130};
        constexpr int BOTTOM_BAR_ALPHA{200};
        constexpr int DOT_Y_FROM_BOTTOM{25};
        constexpr int DOT_RADIUS{5};
        constexpr int DOT_SPACING{16};
        constexpr int BADGE_RADIUS{14};
    }

    namespace Animation {
        constexpr float FRAME_RATE_BASE{60.0f}; // velocities are expressed per 1/60 s
        constexpr float GRAVITY{0.15f};
        constexpr int OFFSCREEN_MARGIN{50};
        constexpr int BANNER_HEIGHT{40};
        constexpr int BANNER_SPARKLES{20};
        constexpr float BANNER_SPEED{50.0f};
    }

    namespace Log {
        constexpr uint64_t MAX_FILE_BYTES{5ull * 1024 * 1024};
        constexpr uint32_t BACKUP_COUNT{3};
    }
}
