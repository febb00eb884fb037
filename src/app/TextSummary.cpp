#include "app/TextSummary.h"

#include <algorithm>

std::string formatTextSummary(const WaitTimesData &data) {
    const std::string rule(60, '=');
    std::string out;
    out += "\n" + rule + "\n";
    out += "DISNEY WORLD WAIT TIMES\n";
    out += rule + "\n";

    for (const auto &park : data.parks) {
        out += "\n" + park.name + "\n";
        out += std::string(40, '-') + "\n";

        auto rides = park.openRides();
        if (rides.empty()) {
            out += "  No rides currently reporting wait times\n";
            continue;
        }
        std::stable_sort(rides.begin(), rides.end(),
                         [](const Ride &a, const Ride &b) { return a.waitTime > b.waitTime; });
        for (const auto &ride : rides) {
            out += "  " + ride.name + ": " + ride.displayWait() + "\n";
        }
    }

    out += "\n" + rule + "\n";
    out += "Total open rides: " + std::to_string(data.allOpenRides().size()) + "\n";
    if (data.lastFetch) {
        out += "Data fetched at: " + TimeHelper::formatClock12(*data.lastFetch) + "\n";
    }
    out += rule + "\n";
    return out;
}
