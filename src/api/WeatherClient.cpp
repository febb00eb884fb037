#include "api/WeatherClient.h"
#include "api/ApiException.h"
#include "logging/Logger.h"

#include <cstdio>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

WeatherClient::WeatherClient(HttpTransport &transport, const Config::WeatherSettings &settings)
    : transport_{transport}, settings_{settings} {
}

std::string WeatherClient::url() const {
    char query[96];
    std::snprintf(query, sizeof(query), "?lat=%.4f&lon=%.4f&units=imperial&appid=",
                  settings_.latitude, settings_.longitude);
    return std::string(BASE_URL) + query + settings_.apiKey;
}

WeatherData WeatherClient::parse(const std::string &body) {
    try {
        const json data = json::parse(body);
        const json &main = data.at("main");
        const json &current = data.at("weather").at(0);

        WeatherData weather;
        weather.temperature = main.at("temp").get<double>();
        weather.humidity = main.at("humidity").get<int>();
        weather.condition = current.at("main").get<std::string>();
        weather.iconCode = current.at("icon").get<std::string>();
        weather.description = current.at("description").get<std::string>();
        return weather;
    } catch (const json::exception &e) {
        throw api_exception(std::string("Failed to parse weather data: ") + e.what());
    }
}

WeatherFetchResult WeatherClient::fetch() {
    if (settings_.apiKey.empty()) {
        Logger::warn(Logger::Source::Weather, tag_, "Weather API key not configured");
        return WeatherFetchResult{false, cached()};
    }

    try {
        const HttpResponse response = transport_.get(url());
        if (response.status != 200) {
            throw api_exception("HTTP " + std::to_string(response.status));
        }
        WeatherData weather = parse(response.body);
        Logger::info(Logger::Source::Weather, tag_, "Weather fetched: %s, %s",
                     weather.tempDisplay().c_str(), weather.condition.c_str());

        std::lock_guard<std::mutex> lock(mutex_);
        cache_ = weather;
        return WeatherFetchResult{true, cache_};
    } catch (const api_exception &e) {
        Logger::error(Logger::Source::Weather, tag_, "Failed to fetch weather: %s", e.what());
    }
    return WeatherFetchResult{false, cached()};
}

std::optional<WeatherData> WeatherClient::cached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_;
}
