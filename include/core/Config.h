#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string>

#ifndef PARKWAIT_PROJECT_DIR
#define PARKWAIT_PROJECT_DIR "."
#endif

/**
 * @brief Runtime configuration from environment variables.
 *
 * Call Config::loadEnvFile() before Config::load().
 * For fixed values, see Constants.h.
 * For compile-time flags, see Flags.h.
 */
namespace Config {
    namespace Runtime {
        /**
         * @brief Get string environment variable with default fallback.
         * @param envName Name of the environment variable
         * @param defaultValue Value to return if variable is not set
         * @return Variable value or default
         */
        inline std::string getEnvStringOr(const char *envName, const std::string &defaultValue) {
            const char *env = std::getenv(envName);
            if (!env) {
                return defaultValue;
            }
            return env;
        }

        /**
         * @brief Get float environment variable with default fallback.
         * @param envName Name of the environment variable
         * @param defaultValue Value to return if variable is not set
         * @return Parsed float value or default
         * @throws std::runtime_error If the value is not a number
         */
        inline float getEnvFloatOr(const char *envName, float defaultValue) {
            const char *env = std::getenv(envName);
            if (!env) {
                return defaultValue;
            }
            try {
                return std::stof(env);
            } catch (const std::exception &) {
                throw std::runtime_error(std::string("Invalid number in ") + envName + ": " + env);
            }
        }

        /**
         * @brief Get double environment variable with default fallback.
         * @throws std::runtime_error If the value is not a number
         */
        inline double getEnvDoubleOr(const char *envName, double defaultValue) {
            const char *env = std::getenv(envName);
            if (!env) {
                return defaultValue;
            }
            try {
                return std::stod(env);
            } catch (const std::exception &) {
                throw std::runtime_error(std::string("Invalid number in ") + envName + ": " + env);
            }
        }

        /**
         * @brief Get uint32 environment variable with default fallback.
         * @param envName Name of the environment variable
         * @param defaultValue Value to return if variable is not set
         * @return Parsed uint32 value or default
         * @throws std::runtime_error If the value is not an unsigned integer
         */
        inline uint32_t getEnvOr(const char *envName, uint32_t defaultValue) {
            const char *env = std::getenv(envName);
            if (!env) {
                return defaultValue;
            }
            char *end;
            unsigned long v = strtoul(env, &end, 10);
            if (*env == '\0' || *end != '\0' || env[0] == '-') {
                throw std::runtime_error(std::string("Invalid integer in ") + envName + ": " + env);
            }
            return static_cast<uint32_t>(v);
        }

        /**
         * @brief Get boolean environment variable (0/1) with default fallback.
         */
        inline bool getEnvBoolOr(const char *envName, bool defaultValue) {
            return getEnvOr(envName, defaultValue ? 1 : 0) != 0;
        }
    }

    /**
     * @brief Default location of the env file.
     */
    inline std::string defaultEnvPath() {
        return std::string(PARKWAIT_PROJECT_DIR) + "/parkwait.env";
    }

    /**
     * @brief Load configuration from an env file.
     *
     * Reads key=value pairs from the env file and sets them as environment
     * variables. Existing environment variables are not overwritten.
     *
     * @param path Env file path
     * @param required When false a missing file is not an error
     * @return true if the file was read
     * @throws std::runtime_error If a required env file cannot be opened
     */
    inline bool loadEnvFile(const std::string &path, bool required) {
        std::ifstream file(path);
        if (!file.is_open()) {
            if (required) {
                throw std::runtime_error("Cannot open: " + path);
            }
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#') {
                continue;
            }

            // Remove "export " prefix if present
            const std::string exportPrefix = "export ";
            if (line.compare(0, exportPrefix.size(), exportPrefix) == 0) {
                line = line.substr(exportPrefix.size());
            }

            auto eqPos = line.find('=');
            if (eqPos == std::string::npos) {
                continue;
            }

            std::string key = line.substr(0, eqPos);
            std::string value = line.substr(eqPos + 1);

            setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
        }
        return true;
    }

    /**
     * @brief Display window and frame pacing.
     */
    struct DisplaySettings {
        uint32_t width{800};
        uint32_t height{480};
        bool fullscreen{false};
        uint32_t fps{30};
        std::string device{"/dev/fb0"};
    };

    /**
     * @brief Card rotation timing.
     */
    struct RotationSettings {
        float displayDuration{8.0f};
        float transitionDuration{0.5f};
        std::string transition{"crossfade"};
    };

    struct ApiSettings {
        uint32_t refreshInterval{300};
        uint32_t timeout{10};
        uint32_t maxRetries{3};
        uint32_t retryDelay{30};
    };

    struct WeatherSettings {
        bool enabled{false};
        std::string apiKey;
        double latitude{28.3772};
        double longitude{-81.5707};
        uint32_t refreshInterval{1800};
    };

    /** Empty path disables persistence. */
    struct DatabaseSettings {
        std::string path;
        uint32_t retentionDays{30};
    };

    struct WebSettings {
        bool enabled{false};
        std::string host{"0.0.0.0"};
        uint32_t port{8080};
    };

    struct LoggingSettings {
        std::string level{"INFO"};
        std::string file{"parkwait.log"};
        bool console{true};
    };

    /**
     * @brief One show kind (fireworks or parades) as written in the env file.
     *
     * schedule format: "park_key=HH:MM,HH:MM;park_key=HH:MM"
     */
    struct ShowSettings {
        bool enabled{false};
        uint32_t duration{0};
        std::string schedule;
    };

    struct EventsSettings {
        ShowSettings fireworks{false, 240, ""};
        ShowSettings parades{false, 120, ""};
    };

    /**
     * @brief Complete application configuration.
     */
    struct AppConfig {
        DisplaySettings display;
        RotationSettings rotation;
        ApiSettings api;
        WeatherSettings weather;
        DatabaseSettings database;
        WebSettings web;
        LoggingSettings logging;
        EventsSettings events;
        std::string assetsDir{"./assets"};
    };

    /**
     * @brief Assemble AppConfig from PARKWAIT_* environment variables.
     * @return Configuration with defaults for every unset key
     * @throws std::runtime_error If a numeric value is malformed
     */
    inline AppConfig load() {
        using namespace Runtime;
        AppConfig c;

        c.display.width = getEnvOr("PARKWAIT_DISPLAY_WIDTH", c.display.width);
        c.display.height = getEnvOr("PARKWAIT_DISPLAY_HEIGHT", c.display.height);
        c.display.fullscreen = getEnvBoolOr("PARKWAIT_DISPLAY_FULLSCREEN", c.display.fullscreen);
        c.display.fps = getEnvOr("PARKWAIT_DISPLAY_FPS", c.display.fps);
        c.display.device = getEnvStringOr("PARKWAIT_DISPLAY_DEVICE", c.display.device);

        c.rotation.displayDuration = getEnvFloatOr("PARKWAIT_ROTATION_DISPLAY_DURATION", c.rotation.displayDuration);
        c.rotation.transitionDuration = getEnvFloatOr("PARKWAIT_ROTATION_TRANSITION_DURATION",
                                                      c.rotation.transitionDuration);
        c.rotation.transition = getEnvStringOr("PARKWAIT_ROTATION_TRANSITION", c.rotation.transition);

        c.api.refreshInterval = getEnvOr("PARKWAIT_API_REFRESH_INTERVAL", c.api.refreshInterval);
        c.api.timeout = getEnvOr("PARKWAIT_API_TIMEOUT", c.api.timeout);
        c.api.maxRetries = getEnvOr("PARKWAIT_API_MAX_RETRIES", c.api.maxRetries);
        c.api.retryDelay = getEnvOr("PARKWAIT_API_RETRY_DELAY", c.api.retryDelay);

        c.weather.enabled = getEnvBoolOr("PARKWAIT_WEATHER_ENABLED", c.weather.enabled);
        c.weather.apiKey = getEnvStringOr("PARKWAIT_WEATHER_API_KEY", c.weather.apiKey);
        c.weather.latitude = getEnvDoubleOr("PARKWAIT_WEATHER_LATITUDE", c.weather.latitude);
        c.weather.longitude = getEnvDoubleOr("PARKWAIT_WEATHER_LONGITUDE", c.weather.longitude);
        c.weather.refreshInterval = getEnvOr("PARKWAIT_WEATHER_REFRESH_INTERVAL", c.weather.refreshInterval);

        c.database.path = getEnvStringOr("PARKWAIT_DATABASE_PATH", c.database.path);
        c.database.retentionDays = getEnvOr("PARKWAIT_DATABASE_RETENTION_DAYS", c.database.retentionDays);

        c.web.enabled = getEnvBoolOr("PARKWAIT_WEB_ENABLED", c.web.enabled);
        c.web.host = getEnvStringOr("PARKWAIT_WEB_HOST", c.web.host);
        c.web.port = getEnvOr("PARKWAIT_WEB_PORT", c.web.port);

        c.logging.level = getEnvStringOr("PARKWAIT_LOG_LEVEL", c.logging.level);
        c.logging.file = getEnvStringOr("PARKWAIT_LOG_FILE", c.logging.file);

        c.events.fireworks.enabled = getEnvBoolOr("PARKWAIT_FIREWORKS_ENABLED", c.events.fireworks.enabled);
        c.events.fireworks.duration = getEnvOr("PARKWAIT_FIREWORKS_DURATION", c.events.fireworks.duration);
        c.events.fireworks.schedule = getEnvStringOr("PARKWAIT_FIREWORKS_SCHEDULE", c.events.fireworks.schedule);
        c.events.parades.enabled = getEnvBoolOr("PARKWAIT_PARADES_ENABLED", c.events.parades.enabled);
        c.events.parades.duration = getEnvOr("PARKWAIT_PARADES_DURATION", c.events.parades.duration);
        c.events.parades.schedule = getEnvStringOr("PARKWAIT_PARADES_SCHEDULE", c.events.parades.schedule);

        c.assetsDir = getEnvStringOr("PARKWAIT_ASSETS_DIR", c.assetsDir);
        return c;
    }

    /**
     * @brief Validate loaded configuration.
     * @throws std::runtime_error If a value is out of range
     */
    inline void validate(const AppConfig &c) {
        if (c.display.width == 0 || c.display.height == 0) {
            throw std::runtime_error("Display size must be positive");
        }
        if (c.display.fps == 0 || c.display.fps > 240) {
            throw std::runtime_error("PARKWAIT_DISPLAY_FPS must be 1-240");
        }
        if (c.rotation.displayDuration <= 0.0f || c.rotation.transitionDuration <= 0.0f) {
            throw std::runtime_error("Rotation durations must be positive");
        }
        if (c.api.refreshInterval == 0) {
            throw std::runtime_error("PARKWAIT_API_REFRESH_INTERVAL must be positive");
        }
        if (c.web.port == 0 || c.web.port > 65535) {
            throw std::runtime_error("PARKWAIT_WEB_PORT must be 1-65535");
        }
    }
}
