#pragma once

#include <unistd.h>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <cstdint>
#include <string>

#include "core/Flags.h"

/**
 * @brief Process-wide logging.
 *
 * Every line goes to stdout in one write() with a wall-clock timestamp,
 * color-coded source tag and level. When a log file is opened the same
 * line (without color codes) is appended to it, with size-based rotation.
 */
namespace Logger {
    /**
     * @brief Log severity levels.
     */
    enum class Level {
        DEBUG, ///< Detailed technical information
        INFO,  ///< Normal operation events
        WARN,  ///< Warning conditions
        ERROR  ///< Error conditions
    };

    /**
     * @brief Log message source identifiers.
     */
    enum class Source : uint8_t {
        Display,   ///< Render loop and rotation
        Scheduler, ///< Show schedule
        Fetcher,   ///< Wait-time API client
        Weather,   ///< Weather API client
        Database,  ///< SQLite history
        Web,       ///< Dashboard server
        Refresh,   ///< Background refresh tasks
        Other      ///< Main and utilities
    };

    namespace detail {
        constexpr const char *names[] = {"DEBUG", "INFO ", "WARN ", "ERROR"};

        inline const char *getTagColor(Source source, Level level) {
            if (level == Level::ERROR) return "\033[31m";
            switch (source) {
                case Source::Display: return "\033[36m";
                case Source::Scheduler: return "\033[35m";
                case Source::Fetcher: return "\033[33m";
                case Source::Weather: return "\033[34m";
                case Source::Database: return "\033[32m";
                case Source::Web: return "\033[96m";
                case Source::Refresh: return "\033[93m";
                default: return "\033[37m";
            }
        }

        inline std::atomic<int> minLevel{static_cast<int>(Level::INFO)};
        inline std::atomic<bool> consoleEnabled{true};

        /** Append a finished line to the log file (no-op when no file is open). */
        void writeToFile(const char *line, size_t length);

        /** Format current local time as [HH:MM:SS] */
        inline void getWallTime(char *buffer, size_t size) {
            time_t now = time(nullptr);
            struct tm local{};
            localtime_r(&now, &local);
            strftime(buffer, size, "[%H:%M:%S]", &local);
        }

        template<typename... Args>
        void log(const Source source, Level level, const char *tag, const char *message, Args... args) {
            if (static_cast<int>(level) < minLevel.load()) {
                return;
            }

            char text[Flags::Logging::LINE_BUFFER_SIZE];
            if constexpr (sizeof...(args) == 0) {
                snprintf(text, sizeof(text), "%s", message);
            } else {
                snprintf(text, sizeof(text), message, args...);
            }

            char timeBuf[16];
            getWallTime(timeBuf, sizeof(timeBuf));

            char buf[Flags::Logging::LINE_BUFFER_SIZE + 128];
            if (consoleEnabled.load()) {
                int n = snprintf(buf, sizeof(buf) - 1, "\033[90m%s\033[0m %s[%s] [%s]\033[0m %s",
                                 timeBuf,
                                 getTagColor(source, level),
                                 names[static_cast<int>(level)],
                                 tag,
                                 text);
                if (n < 0) return;
                if (n > static_cast<int>(sizeof(buf) - 2)) n = static_cast<int>(sizeof(buf) - 2);
                buf[n++] = '\n';
                write(STDOUT_FILENO, buf, n);
            }

            int n = snprintf(buf, sizeof(buf) - 1, "%s [%s] [%s] %s",
                             timeBuf, names[static_cast<int>(level)], tag, text);
            if (n < 0) return;
            if (n > static_cast<int>(sizeof(buf) - 2)) n = static_cast<int>(sizeof(buf) - 2);
            buf[n++] = '\n';
            writeToFile(buf, static_cast<size_t>(n));
        }
    }

    /**
     * @brief Set the minimum level that is emitted.
     */
    inline void setLevel(Level level) {
        detail::minLevel.store(static_cast<int>(level));
    }

    /**
     * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR).
     * @param name Level name, case-sensitive upper case
     * @param out Parsed level
     * @return true if the name is known
     */
    inline bool parseLevel(const std::string &name, Level &out) {
        if (name == "DEBUG") out = Level::DEBUG;
        else if (name == "INFO") out = Level::INFO;
        else if (name == "WARNING" || name == "WARN") out = Level::WARN;
        else if (name == "ERROR") out = Level::ERROR;
        else return false;
        return true;
    }

    /**
     * @brief Enable or disable terminal output.
     */
    inline void setConsoleEnabled(bool enabled) {
        detail::consoleEnabled.store(enabled);
    }

    /**
     * @brief Open (append) a rotating log file.
     * @param path File path; rotated to path.1 .. path.N when it grows too large
     * @return false if the file could not be opened
     */
    bool openFile(const std::string &path);

    /**
     * @brief Close the log file, if open.
     */
    void closeFile();

    /**
     * @brief Log a debug message.
     * @param source Source subsystem
     * @param tag Short identifier (e.g., "Rotation")
     * @param message Format string (printf-style)
     * @param args Format arguments
     */
    template<typename... Args>
    void debug(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_DEBUG_ENABLED) {
            detail::log(source, Level::DEBUG, tag, message, args...);
        }
    }

    /**
     * @brief Log an info message.
     * @param source Source subsystem
     * @param tag Short identifier
     * @param message Format string (printf-style)
     * @param args Format arguments
     */
    template<typename... Args>
    void info(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_INFO_ENABLED) {
            detail::log(source, Level::INFO, tag, message, args...);
        }
    }

    /**
     * @brief Log a warning message.
     * @param source Source subsystem
     * @param tag Short identifier
     * @param message Format string (printf-style)
     * @param args Format arguments
     */
    template<typename... Args>
    void warn(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_WARN_ENABLED) {
            detail::log(source, Level::WARN, tag, message, args...);
        }
    }

    /**
     * @brief Log an error message.
     * @param source Source subsystem
     * @param tag Short identifier
     * @param message Format string (printf-style)
     * @param args Format arguments
     */
    template<typename... Args>
    void error(Source source, const char *tag, const char *message, Args... args) {
        if constexpr (Flags::Logging::IS_ERROR_ENABLED) {
            detail::log(source, Level::ERROR, tag, message, args...);
        }
    }

    /**
     * @brief Log a POSIX error with errno description.
     * @param source Source subsystem
     * @param tag Short identifier
     * @param message Context message
     *
     * Appends strerror(errno) to the message.
     */
    inline void perror(Source source, const char *tag, const char *message) {
        if constexpr (Flags::Logging::IS_ERROR_ENABLED) {
            detail::log(source, Level::ERROR, tag, "%s: %s", message, strerror(errno));
        }
    }

    /**
     * @brief Log a state transition.
     * @param source Source subsystem
     * @param tag Short identifier
     * @param from Previous state name
     * @param to New state name
     */
    inline void stateChange(Source source, const char *tag, const char *from, const char *to) {
        if constexpr (Flags::Logging::IS_INFO_ENABLED) {
            detail::log(source, Level::INFO, tag, "%s -> %s", from, to);
        }
    }

    /**
     * @brief Print a visual separator line.
     * @param ch Character to use for the line
     * @param count Number of characters in the line
     */
    inline void separator(char ch = '-', int count = 60) {
        if (!detail::consoleEnabled.load()) return;
        char buf[128];
        int n = (count < 127) ? count : 127;
        memset(buf, ch, n);
        buf[n++] = '\n';
        write(STDOUT_FILENO, buf, n);
    }
}
