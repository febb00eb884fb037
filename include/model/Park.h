#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "core/Constants.h"
#include "model/Ride.h"

/**
 * @brief Static description of a supported park.
 *
 * key is the configuration/storage identifier ("magic_kingdom"),
 * eventSlug names show assets ("magic-kingdom").
 */
struct ParkInfo {
    const char *key;
    uint32_t apiId;
    const char *name;
    const char *eventSlug;
};

namespace ParkCatalog {
    /** Walt Disney World parks in display order. */
    inline constexpr std::array<ParkInfo, 4> parks{{
        {"magic_kingdom", 6, "Magic Kingdom", "magic-kingdom"},
        {"epcot", 5, "EPCOT", "epcot"},
        {"hollywood_studios", 7, "Hollywood Studios", "hollywood-studios"},
        {"animal_kingdom", 8, "Animal Kingdom", "animal-kingdom"},
    }};

    /**
     * @brief Look up a park by configuration key.
     * @return nullptr if the key is unknown
     */
    inline const ParkInfo *findByKey(const std::string &key) {
        for (const auto &p : parks) {
            if (key == p.key) return &p;
        }
        return nullptr;
    }
}

/**
 * @brief A park with the rides of one fetch.
 */
struct Park {
    uint32_t id{0};
    std::string name;
    std::string slug; ///< configuration key, e.g. "magic_kingdom"
    std::vector<Ride> rides;

    /**
     * @brief Rides that are open and report a positive wait.
     */
    std::vector<Ride> openRides() const {
        std::vector<Ride> result;
        for (const auto &r : rides) {
            if (r.isOpen && r.waitTime > 0) result.push_back(r);
        }
        return result;
    }
};

/**
 * @brief Notice card for a park with nothing open.
 */
struct ClosedPark {
    std::string name;
    std::string slug;
    std::string opensAt{Constants::Park::DEFAULT_OPENS_AT};
};
