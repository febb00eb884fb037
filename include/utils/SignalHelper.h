#pragma once

#include <csignal>
#include <unistd.h>
#include "logging/Logger.h"

/**
 * @brief Signal handling for the kiosk process.
 *
 * Handlers only set flags; the render loop polls them.
 * All handlers use only async-signal-safe operations.
 */
namespace SignalHelper {
    inline constexpr auto tag = "SignalHelper";

    /**
     * @brief Signal state flags structure.
     *
     * Uses volatile sig_atomic_t for safe access from signal handlers.
     * All flags are initially 0 (false).
     */
    struct Flags {
        volatile sig_atomic_t exit{0};   ///< SIGTERM/SIGINT received (shutdown)
        volatile sig_atomic_t reload{0}; ///< SIGHUP received (reopen log file)
    };

    namespace detail {
        inline Flags *g_flags = nullptr;

        inline void handler(const int32_t sig) {
            // Must stay async-signal-safe: flag assignment only.
            if (!g_flags) return;
            switch (sig) {
                case SIGTERM:
                case SIGINT:
                    g_flags->exit = 1;
                    break;
                case SIGHUP:
                    g_flags->reload = 1;
                    break;
                default:
                    break;
            }
        }
    }

    /**
     * @brief Install signal handlers.
     * @param flags Reference to Flags structure that will be updated by handlers
     *
     * Installs handlers for SIGTERM, SIGINT and SIGHUP and ignores SIGPIPE
     * so a dashboard client closing its socket cannot kill the kiosk.
     */
    inline void setup(Flags &flags) {
        detail::g_flags = &flags;

        struct sigaction sa{};
        sa.sa_handler = detail::handler;
        sigemptyset(&sa.sa_mask);

        sigaction(SIGTERM, &sa, nullptr);
        sigaction(SIGINT, &sa, nullptr);
        sigaction(SIGHUP, &sa, nullptr);

        signal(SIGPIPE, SIG_IGN);

        Logger::debug(Logger::Source::Other, tag, "setup done");
    }

    /**
     * @brief Check if exit signal was received.
     * @param flags Reference to Flags structure
     * @return true if SIGTERM or SIGINT was received
     */
    inline bool shouldExit(const Flags &flags) {
        return flags.exit != 0;
    }

    /**
     * @brief Clear a signal flag.
     * @param flag Reference to the flag to clear
     */
    inline void clearFlag(volatile sig_atomic_t &flag) {
        flag = 0;
    }
}
