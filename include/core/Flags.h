#pragma once

#include <cstdint>

/**
 * @brief Compile-time flags.
 *
 * These values must be constexpr because they are used:
 * - For fixed buffer sizes (log lines, HTTP request buffers)
 * - With if constexpr for conditional compilation (logging)
 */
namespace Flags {

    namespace Display {
        constexpr uint32_t MAX_PROGRESS_DOTS{25}; // Longer queues show a window around the current card
    }

    namespace Logging {
        constexpr bool IS_DEBUG_ENABLED{true}; // Runtime level still filters DEBUG by default
        constexpr bool IS_INFO_ENABLED{true};
        constexpr bool IS_WARN_ENABLED{true};
        constexpr bool IS_ERROR_ENABLED{true};

        constexpr uint32_t LINE_BUFFER_SIZE{1024};
    }

}
