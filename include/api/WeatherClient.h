#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "api/HttpTransport.h"
#include "core/Config.h"
#include "model/Weather.h"

/**
 * @brief Outcome of one weather request.
 *
 * weather falls back to the last good reading when the request fails;
 * fetchSuccess tells a new reading apart from that cached one.
 */
struct WeatherFetchResult {
    bool fetchSuccess{false};
    std::optional<WeatherData> weather;
};

/**
 * @brief Anything that can report current weather.
 */
class WeatherSource {
public:
    virtual ~WeatherSource() = default;

    virtual WeatherFetchResult fetch() = 0;
};

/**
 * @brief OpenWeatherMap current-conditions client (imperial units).
 */
class WeatherClient : public WeatherSource {
public:
    static constexpr auto BASE_URL{"https://api.openweathermap.org/data/2.5/weather"};

    WeatherClient(HttpTransport &transport, const Config::WeatherSettings &settings);

    WeatherFetchResult fetch() override;

    std::optional<WeatherData> cached() const;

    /**
     * @throws api_exception If main.temp, main.humidity or weather[0] is missing
     */
    static WeatherData parse(const std::string &body);

    std::string url() const;

private:
    static constexpr auto tag_{"Weather"};

    HttpTransport &transport_;
    Config::WeatherSettings settings_;

    mutable std::mutex mutex_;
    std::optional<WeatherData> cache_;
};
