#include "api/QueueTimesClient.h"
#include "api/ApiException.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cstdio>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
    void appendRides(const json &list, const ParkInfo &info, std::vector<Ride> &out) {
        if (!list.is_array()) {
            return;
        }
        for (const auto &entry : list) {
            if (!entry.is_object()) {
                continue;
            }
            Ride ride;
            ride.id = entry.value("id", 0u);
            ride.name = entry.value("name", std::string{"Unknown"});
            const auto wait = entry.find("wait_time");
            if (wait != entry.end() && wait->is_number()) {
                ride.waitTime = static_cast<uint32_t>(std::max<int64_t>(0, wait->get<int64_t>()));
            }
            const auto open = entry.find("is_open");
            ride.isOpen = open != entry.end() && open->is_boolean() && open->get<bool>();
            ride.parkId = info.apiId;
            ride.parkName = info.name;
            out.push_back(std::move(ride));
        }
    }
}

QueueTimesClient::QueueTimesClient(HttpTransport &transport, const Config::ApiSettings &settings)
    : transport_{transport}, settings_{settings} {
}

std::string QueueTimesClient::urlFor(const ParkInfo &info) {
    char url[128];
    std::snprintf(url, sizeof(url), URL_TEMPLATE, info.apiId);
    return url;
}

std::vector<Ride> QueueTimesClient::parseRides(const std::string &body, const ParkInfo &info) {
    std::vector<Ride> rides;
    try {
        const json data = json::parse(body);
        if (!data.is_object()) {
            throw api_exception("Unexpected payload: not an object");
        }
        if (const auto lands = data.find("lands"); lands != data.end() && lands->is_array()) {
            for (const auto &land : *lands) {
                if (land.is_object()) {
                    if (const auto list = land.find("rides"); list != land.end()) {
                        appendRides(*list, info, rides);
                    }
                }
            }
        }
        if (const auto list = data.find("rides"); list != data.end()) {
            appendRides(*list, info, rides);
        }
    } catch (const json::exception &e) {
        throw api_exception(std::string("Parse error: ") + e.what());
    }
    return rides;
}

Park QueueTimesClient::requestPark(const ParkInfo &info) {
    const HttpResponse response = transport_.get(urlFor(info));
    if (response.status != 200) {
        throw api_exception("HTTP " + std::to_string(response.status));
    }
    Park park;
    park.id = info.apiId;
    park.name = info.name;
    park.slug = info.key;
    park.rides = parseRides(response.body, info);
    return park;
}

bool QueueTimesClient::waitBeforeRetry() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::seconds(settings_.retryDelay), [this] { return cancelled_; });
    return !cancelled_;
}

std::optional<Park> QueueTimesClient::fetchPark(const ParkInfo &info) {
    const uint32_t attempts = std::max<uint32_t>(1, settings_.maxRetries);
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        try {
            return requestPark(info);
        } catch (const api_exception &e) {
            Logger::warn(Logger::Source::Fetcher, tag_, "%s (attempt %u/%u): %s",
                         info.name, attempt, attempts, e.what());
        }
        if (attempt < attempts && !waitBeforeRetry()) {
            break;
        }
    }
    return std::nullopt;
}

FetchResult QueueTimesClient::fetchAll() {
    auto data = std::make_shared<WaitTimesData>();
    for (const auto &info : ParkCatalog::parks) {
        if (auto park = fetchPark(info)) {
            Logger::info(Logger::Source::Fetcher, tag_, "Fetched %s: %zu open rides",
                         park->name.c_str(), park->openRides().size());
            data->parks.push_back(std::move(*park));
        }
    }

    FetchResult result;
    result.attemptedAt = TimeHelper::Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    if (data->parks.empty()) {
        result.fetchSuccess = false;
        result.errorMessage = ALL_PARKS_FAILED;
        result.snapshot = cache_;
        Logger::error(Logger::Source::Fetcher, tag_, "%s", ALL_PARKS_FAILED);
        if (cache_) {
            Logger::info(Logger::Source::Fetcher, tag_, "Returning cached data due to fetch failure");
        }
        return result;
    }

    data->lastFetch = result.attemptedAt;
    data->fetchSuccess = true;
    cache_ = data;
    result.fetchSuccess = true;
    result.snapshot = cache_;
    Logger::info(Logger::Source::Fetcher, tag_, "Successfully fetched %zu open rides total",
                 data->allOpenRides().size());
    return result;
}

void QueueTimesClient::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

std::shared_ptr<const WaitTimesData> QueueTimesClient::cached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_;
}
