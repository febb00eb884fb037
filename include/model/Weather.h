#pragma once

#include <cmath>
#include <string>

/**
 * @brief Current conditions for the header overlay.
 */
struct WeatherData {
    double temperature{0.0}; ///< Fahrenheit
    std::string condition;   ///< e.g. "Clouds"
    std::string iconCode;    ///< OpenWeatherMap icon id, e.g. "04d"
    int humidity{0};         ///< percent
    std::string description; ///< e.g. "broken clouds"

    /**
     * @brief Rounded temperature, e.g. "84°F".
     */
    std::string tempDisplay() const {
        return std::to_string(static_cast<long>(std::lround(temperature))) + "\xC2\xB0" "F";
    }
};
