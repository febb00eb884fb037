#pragma once

#include <cstdlib>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <unistd.h>

/**
 * @brief Command-line argument parsing for the kiosk executable.
 */
namespace ArgumentParser {
    namespace detail {
        /**
         * @brief Write error message to stderr.
         * @param msg Error message to display
         */
        inline void err(const char *msg) {
            char buf[256];
            int n = snprintf(buf, sizeof(buf), "Error: %s\n", msg);
            write(STDERR_FILENO, buf, n);
        }

        /**
         * @brief Write usage message to stderr.
         * @param program Program name (argv[0])
         * @param args Expected arguments description
         */
        inline void usage(const char *program, const char *args) {
            char buf[512];
            int n = snprintf(buf, sizeof(buf), "Usage: %s %s\n", program, args);
            write(STDERR_FILENO, buf, n);
        }

        constexpr const char *USAGE_ARGS =
                "[--text-only] [--fullscreen] [--config <file>]\n"
                "       [--log-level DEBUG|INFO|WARNING|ERROR] [--no-console-log]\n"
                "       [--test-event fireworks|fireworks-epcot|parade] [--help]";
    }

    /**
     * @brief Parse string to uint32_t.
     * @param str Input string
     * @param out Output value
     * @return true if parsing succeeded, false otherwise
     */
    inline bool parseUint32(const char *str, uint32_t &out) {
        char *end;
        out = static_cast<uint32_t>(strtoul(str, &end, 10));
        return *str != '\0' && *end == '\0';
    }

    /**
     * @brief Parse string to one of a fixed set of choices.
     * @param str Input string
     * @param choices nullptr-terminated list of accepted values
     * @return true if str is one of the choices
     */
    inline bool parseChoice(const char *str, const char *const *choices) {
        for (const char *const *c = choices; *c != nullptr; ++c) {
            if (strcmp(str, *c) == 0) return true;
        }
        return false;
    }

    // ==================== Argument Structures ====================

    /**
     * @brief Arguments of the kiosk executable.
     */
    struct AppArgs {
        bool textOnly{false};     ///< Print a summary and exit
        bool fullscreen{false};   ///< Override display fullscreen setting
        bool consoleLog{true};    ///< Log to the terminal
        bool showHelp{false};     ///< --help given
        std::string configPath;   ///< Env file; empty = default location
        std::string logLevel;     ///< Empty = take from config
        std::string testEvent;    ///< Empty = scheduled events only
    };

    // ==================== Parsers ====================

    /**
     * @brief Print usage to stderr.
     */
    inline void printUsage(const char *program) {
        detail::usage(program, detail::USAGE_ARGS);
    }

    /**
     * @brief Parse command-line arguments of the kiosk.
     * @param argc Argument count
     * @param argv Argument values
     * @param args Output AppArgs structure
     * @return true if all arguments were parsed successfully, false otherwise
     */
    inline bool parseAppArgs(int argc, char *argv[], AppArgs &args) {
        static constexpr const char *levels[] = {"DEBUG", "INFO", "WARNING", "ERROR", nullptr};
        static constexpr const char *events[] = {"fireworks", "fireworks-epcot", "parade", nullptr};

        for (int i = 1; i < argc; ++i) {
            const char *arg = argv[i];
            if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
                args.showHelp = true;
            } else if (strcmp(arg, "--text-only") == 0) {
                args.textOnly = true;
            } else if (strcmp(arg, "--fullscreen") == 0) {
                args.fullscreen = true;
            } else if (strcmp(arg, "--no-console-log") == 0) {
                args.consoleLog = false;
            } else if (strcmp(arg, "--config") == 0) {
                if (i + 1 >= argc) {
                    detail::err("--config requires a file path");
                    return false;
                }
                args.configPath = argv[++i];
            } else if (strcmp(arg, "--log-level") == 0) {
                if (i + 1 >= argc || !parseChoice(argv[i + 1], levels)) {
                    detail::err("--log-level must be DEBUG, INFO, WARNING or ERROR");
                    return false;
                }
                args.logLevel = argv[++i];
            } else if (strcmp(arg, "--test-event") == 0) {
                if (i + 1 >= argc || !parseChoice(argv[i + 1], events)) {
                    detail::err("--test-event must be fireworks, fireworks-epcot or parade");
                    return false;
                }
                args.testEvent = argv[++i];
            } else {
                char msg[160];
                snprintf(msg, sizeof(msg), "Unknown argument: %s", arg);
                detail::err(msg);
                printUsage(argv[0]);
                return false;
            }
        }
        return true;
    }
}
