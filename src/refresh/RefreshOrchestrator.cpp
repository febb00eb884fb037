#include "refresh/RefreshOrchestrator.h"
#include "core/Constants.h"
#include "data/DatabaseException.h"
#include "logging/Logger.h"

RefreshOrchestrator::RefreshOrchestrator(WaitTimesSource &source, DisplaySink &sink, WaitTimesStore *store,
                                         WeatherSource *weather)
    : source_{source}, sink_{sink}, store_{store}, weather_{weather} {
}

RefreshOrchestrator::~RefreshOrchestrator() {
    stop();
}

void RefreshOrchestrator::storeSnapshot(const WaitTimesData &data) {
    if (!store_) {
        return;
    }
    try {
        store_->storeWaitTimes(data.allOpenRides());
        store_->cleanupOldData();
    } catch (const database_exception &e) {
        Logger::warn(Logger::Source::Database, tag_, "History not stored: %s", e.what());
    }
}

bool RefreshOrchestrator::refreshWaitTimes() {
    Logger::info(Logger::Source::Refresh, tag_, "Refreshing wait times data...");
    const FetchResult result = source_.fetchAll();

    if (result.fetchSuccess && result.snapshot) {
        failures_ = 0;
        sink_.setDisplaySnapshot(result.snapshot);
        Logger::info(Logger::Source::Refresh, tag_, "Wait times refreshed: %zu rides",
                     result.snapshot->allOpenRides().size());
        storeSnapshot(*result.snapshot);
        return true;
    }

    const uint32_t failures = ++failures_;
    sink_.reportFetchFailure(result.errorMessage);
    if (failures >= Constants::Refresh::MAX_CONSECUTIVE_FAILURES) {
        Logger::error(Logger::Source::Refresh, tag_, "Data refresh failed %u times in a row: %s",
                      failures, result.errorMessage.c_str());
    } else {
        Logger::warn(Logger::Source::Refresh, tag_, "Failed to refresh data (attempt %u): %s",
                     failures, result.errorMessage.c_str());
    }
    return false;
}

void RefreshOrchestrator::refreshWeather() {
    if (!weather_) {
        return;
    }
    WeatherFetchResult result = weather_->fetch();
    if (!result.weather) {
        return;
    }
    // A cached reading is already in the history
    if (result.fetchSuccess && store_) {
        Logger::debug(Logger::Source::Weather, tag_, "Weather refreshed: %s",
                      result.weather->tempDisplay().c_str());
        try {
            store_->storeWeather(*result.weather);
        } catch (const database_exception &e) {
            Logger::warn(Logger::Source::Database, tag_, "Weather not stored: %s", e.what());
        }
    }
    sink_.setWeather(std::move(result.weather));
}

void RefreshOrchestrator::start(const Config::ApiSettings &api, const Config::WeatherSettings &weather) {
    waitTask_ = std::make_unique<PeriodicTask>("WaitRefresh", std::chrono::seconds(api.refreshInterval),
                                               [this]() { refreshWaitTimes(); });
    waitTask_->start();
    Logger::info(Logger::Source::Refresh, tag_, "Data refresh task started (interval: %us)", api.refreshInterval);

    if (weather_) {
        weatherTask_ = std::make_unique<PeriodicTask>("WeatherRefresh",
                                                      std::chrono::seconds(weather.refreshInterval),
                                                      [this]() { refreshWeather(); });
        weatherTask_->start();
        Logger::info(Logger::Source::Refresh, tag_, "Weather refresh task started (interval: %us)",
                     weather.refreshInterval);
    }
}

void RefreshOrchestrator::stop() {
    source_.cancel();
    if (waitTask_) {
        waitTask_->stop();
        waitTask_.reset();
    }
    if (weatherTask_) {
        weatherTask_->stop();
        weatherTask_.reset();
    }
}
