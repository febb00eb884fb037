#pragma once

#include <memory>
#include <optional>
#include <string>

#include "model/WaitTimesData.h"
#include "model/Weather.h"

/**
 * @brief Receiving end of the refresh tasks.
 *
 * Implemented by RotationController; called from background threads.
 */
class DisplaySink {
public:
    virtual ~DisplaySink() = default;

    virtual void setDisplaySnapshot(std::shared_ptr<const WaitTimesData> data) = 0;

    virtual void reportFetchFailure(const std::string &message) = 0;

    virtual void setWeather(std::optional<WeatherData> weather) = 0;
};
