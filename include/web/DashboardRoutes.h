#pragma once

#include <string>

#include "data/WaitTimesDatabase.h"

/**
 * @brief Status and JSON body of one dashboard reply.
 */
struct HttpReply {
    int status{200};
    std::string body;
};

/**
 * @brief Read-only JSON API over the wait-time history.
 *
 * | Route                         | Query          |
 * |-------------------------------|----------------|
 * | /api/waits                    |                |
 * | /api/history/<ride>           | hours (24)     |
 * | /api/park/<park>              | hours (24)     |
 * | /api/stats/<ride>             | days (7)       |
 * | /api/rides, /api/parks        |                |
 * | /api/db-stats                 |                |
 *
 * Unknown paths give 404, other methods 405, database failures 500;
 * every reply body is JSON.
 */
class DashboardRoutes {
public:
    /**
     * @param database May be null: every route then answers 500
     */
    explicit DashboardRoutes(const WaitTimesDatabase *database);

    HttpReply handle(const std::string &method, const std::string &target) const;

    /** Decode %XX escapes and '+' in a path segment or query value. */
    static std::string urlDecode(const std::string &text);

private:
    static constexpr auto tag_{"Dashboard"};

    const WaitTimesDatabase *database_;

    HttpReply route(const std::string &path, const std::string &query) const;
};
