#include "web/DashboardRoutes.h"
#include "data/DatabaseException.h"
#include "logging/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
    HttpReply jsonReply(int status, const json &body) {
        return HttpReply{status, body.dump()};
    }

    HttpReply errorReply(int status, const std::string &message) {
        return jsonReply(status, json{{"error", message}});
    }

    bool startsWith(const std::string &s, const std::string &prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    /**
     * @brief Integer query parameter; missing or malformed values give fallback.
     */
    uint32_t queryUint(const std::string &query, const std::string &key, uint32_t fallback) {
        size_t pos = 0;
        while (pos <= query.size()) {
            const size_t end = std::min(query.find('&', pos), query.size());
            const std::string pair = query.substr(pos, end - pos);
            const size_t eq = pair.find('=');
            if (eq != std::string::npos && pair.compare(0, eq, key) == 0) {
                const std::string value = DashboardRoutes::urlDecode(pair.substr(eq + 1));
                char *tail = nullptr;
                const unsigned long parsed = std::strtoul(value.c_str(), &tail, 10);
                if (!value.empty() && value[0] != '-' && tail && *tail == '\0' && parsed <= 24 * 365 * 10) {
                    return static_cast<uint32_t>(parsed);
                }
                return fallback;
            }
            pos = end + 1;
        }
        return fallback;
    }

    std::string isoNow() {
        const std::time_t t = std::time(nullptr);
        std::tm local{};
        localtime_r(&t, &local);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
        return buf;
    }

    json optionalText(const std::optional<std::string> &value) {
        return value ? json(*value) : json(nullptr);
    }
}

DashboardRoutes::DashboardRoutes(const WaitTimesDatabase *database) : database_{database} {
}

std::string DashboardRoutes::urlDecode(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::strtol(text.substr(i + 1, 2).c_str(), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

HttpReply DashboardRoutes::handle(const std::string &method, const std::string &target) const {
    if (method != "GET") {
        return errorReply(405, "Method not allowed");
    }
    const size_t q = target.find('?');
    const std::string path = target.substr(0, q);
    const std::string query = q == std::string::npos ? "" : target.substr(q + 1);

    if (!startsWith(path, "/api/")) {
        return errorReply(404, "Not found");
    }
    if (!database_) {
        return errorReply(500, "Database not initialized");
    }
    try {
        return route(path, query);
    } catch (const database_exception &e) {
        Logger::error(Logger::Source::Web, tag_, "%s: %s", path.c_str(), e.what());
        return errorReply(500, e.what());
    }
}

HttpReply DashboardRoutes::route(const std::string &path, const std::string &query) const {
    if (path == "/api/waits") {
        json waits = json::array();
        for (const auto &w : database_->currentWaits()) {
            waits.push_back({{"ride_name", w.rideName}, {"park_name", w.parkName}, {"wait_time", w.waitTime},
                             {"is_open", w.isOpen}, {"timestamp", w.timestamp}});
        }
        return jsonReply(200, json{{"timestamp", isoNow()}, {"waits", waits}});
    }

    if (startsWith(path, "/api/history/") && path.size() > 13) {
        const std::string ride = urlDecode(path.substr(13));
        const uint32_t hours = queryUint(query, "hours", 24);
        json history = json::array();
        for (const auto &s : database_->rideHistory(ride, hours)) {
            history.push_back({{"timestamp", s.timestamp}, {"wait_time", s.waitTime}});
        }
        return jsonReply(200, json{{"ride_name", ride}, {"hours", hours}, {"history", history}});
    }

    if (startsWith(path, "/api/park/") && path.size() > 10) {
        const std::string park = urlDecode(path.substr(10));
        const uint32_t hours = queryUint(query, "hours", 24);
        json history = json::array();
        for (const auto &s : database_->parkHistory(park, hours)) {
            history.push_back({{"timestamp", s.timestamp}, {"avg_wait", s.avgWait}, {"ride_count", s.rideCount}});
        }
        return jsonReply(200, json{{"park_name", park}, {"hours", hours}, {"history", history}});
    }

    if (startsWith(path, "/api/stats/") && path.size() > 11) {
        const std::string ride = urlDecode(path.substr(11));
        const uint32_t days = queryUint(query, "days", 7);
        const RideStats s = database_->rideStats(ride, days);
        return jsonReply(200, json{{"ride_name", ride}, {"days", days},
                                   {"stats", {{"min_wait", s.minWait}, {"max_wait", s.maxWait},
                                              {"avg_wait", s.avgWait}, {"data_points", s.dataPoints}}}});
    }

    if (path == "/api/rides") {
        return jsonReply(200, json{{"rides", database_->allRides()}});
    }

    if (path == "/api/parks") {
        return jsonReply(200, json{{"parks", database_->allParks()}});
    }

    if (path == "/api/db-stats") {
        const DatabaseStats s = database_->databaseStats();
        return jsonReply(200, json{{"wait_records", s.waitRecords}, {"oldest_record", optionalText(s.oldestRecord)},
                                   {"newest_record", optionalText(s.newestRecord)}, {"db_path", s.dbPath},
                                   {"retention_days", s.retentionDays}});
    }

    return errorReply(404, "Not found");
}
