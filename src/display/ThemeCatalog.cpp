#include "display/ThemeCatalog.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace ThemeCatalog {
    namespace {
        struct Mapping {
            const char *pattern;
            const char *value;
        };

        const Mapping rideThemes[] = {
            // Magic Kingdom - Tomorrowland
            {"space mountain", "scifi"}, {"tron", "scifi"}, {"astro orbiter", "scifi"},
            {"buzz lightyear", "scifi"}, {"space ranger", "scifi"}, {"peoplemover", "future"},
            {"transit authority", "future"}, {"carousel of progress", "future"},
            {"tomorrowland speedway", "future"}, {"monsters inc", "playful"}, {"laugh floor", "playful"},
            // Fantasyland / Liberty Square
            {"haunted mansion", "spooky"}, {"seven dwarfs", "fantasy"}, {"peter pan", "fantasy"},
            {"small world", "whimsical"}, {"little mermaid", "fantasy"}, {"under the sea", "fantasy"},
            {"dumbo", "playful"}, {"mad tea", "playful"}, {"carrousel", "fantasy"},
            {"regal carrousel", "fantasy"}, {"barnstormer", "playful"}, {"winnie the pooh", "whimsical"},
            {"philharmagic", "fantasy"}, {"princess", "fantasy"}, {"cinderella", "fantasy"},
            {"enchanted tales", "fantasy"}, {"tiana", "whimsical"}, {"bayou adventure", "whimsical"},
            // Adventureland / Frontierland
            {"pirates", "pirate"}, {"jungle cruise", "adventure"}, {"magic carpets", "adventure"},
            {"tiki room", "adventure"}, {"enchanted tiki", "adventure"}, {"big thunder", "adventure"},
            {"splash mountain", "adventure"}, {"country bear", "adventure"}, {"tom sawyer", "adventure"},
            {"hall of presidents", "classic"},
            // EPCOT
            {"guardians", "scifi"}, {"cosmic rewind", "scifi"}, {"test track", "scifi"},
            {"spaceship earth", "future"}, {"mission: space", "scifi"}, {"mission space", "scifi"},
            {"frozen", "fantasy"}, {"remy", "whimsical"}, {"ratatouille", "whimsical"},
            {"soarin", "adventure"}, {"figment", "whimsical"}, {"imagination", "whimsical"},
            {"nemo", "whimsical"}, {"seas with nemo", "whimsical"}, {"living with the land", "adventure"},
            {"gran fiesta", "whimsical"}, {"three caballeros", "whimsical"}, {"turtle talk", "whimsical"},
            {"journey of water", "adventure"}, {"moana", "adventure"},
            // Hollywood Studios
            {"tower of terror", "spooky"}, {"twilight zone", "spooky"}, {"rock 'n' roller", "action"},
            {"aerosmith", "action"}, {"slinky dog", "playful"}, {"toy story", "playful"},
            {"alien swirling", "playful"}, {"rise of the resistance", "starwars"},
            {"millennium falcon", "starwars"}, {"smugglers run", "starwars"}, {"star tours", "starwars"},
            {"runaway railway", "playful"}, {"mickey & minnie", "playful"}, {"indiana jones", "adventure"},
            {"epic stunt", "adventure"}, {"muppet", "playful"}, {"beauty and the beast", "fantasy"},
            {"frozen sing", "fantasy"},
            // Animal Kingdom
            {"flight of passage", "avatar"}, {"avatar", "avatar"}, {"na'vi river", "avatar"},
            {"everest", "adventure"}, {"expedition everest", "adventure"}, {"kilimanjaro", "adventure"},
            {"safari", "adventure"}, {"kali river", "adventure"}, {"lion king", "adventure"},
            {"festival of the lion", "adventure"}, {"finding nemo", "whimsical"}, {"big blue", "whimsical"},
            {"gorilla falls", "adventure"}, {"zootopia", "playful"}, {"wildlife express", "adventure"},
            {"railroad", "classic"}, {"speedway", "future"},
            // Character meets
            {"meet mickey", "classic"}, {"town square", "classic"}, {"princess fairytale", "fantasy"},
            {"royal sommerhus", "fantasy"}, {"meet anna", "fantasy"}, {"meet elsa", "fantasy"},
            {"red carpet", "playful"}, {"meet olaf", "fantasy"}, {"celebrity spotlight", "playful"},
            {"adventurers outpost", "adventure"}, {"meet beloved", "classic"},
        };

        const Mapping rideImages[] = {
            // Magic Kingdom
            {"space mountain", "space_mountain"}, {"haunted mansion", "haunted_mansion"},
            {"pirates", "pirates_caribbean"}, {"jungle cruise", "jungle_cruise"}, {"big thunder", "big_thunder"},
            {"seven dwarfs", "seven_dwarfs"}, {"small world", "small_world"}, {"peter pan", "peter_pan"},
            {"tron", "tron"}, {"tiana", "tiana"}, {"bayou adventure", "tiana"},
            {"buzz lightyear", "buzz_lightyear"}, {"space ranger", "buzz_lightyear"}, {"dumbo", "dumbo"},
            {"winnie the pooh", "winnie_pooh"}, {"mad tea party", "mad_tea_party"},
            {"country bear", "country_bear"}, {"carousel of progress", "carousel_progress"},
            {"peoplemover", "peoplemover"}, {"transit authority", "peoplemover"},
            {"little mermaid", "little_mermaid"}, {"under the sea", "little_mermaid"},
            {"astro orbiter", "astro_orbiter"}, {"barnstormer", "barnstormer"},
            {"magic carpets", "magic_carpets"}, {"aladdin", "magic_carpets"}, {"monsters inc", "monsters_inc"},
            {"laugh floor", "monsters_inc"}, {"philharmagic", "philharmagic"}, {"enchanted tiki", "tiki_room"},
            // EPCOT
            {"guardians", "guardians_galaxy"}, {"cosmic rewind", "guardians_galaxy"}, {"frozen", "frozen"},
            {"test track", "test_track"}, {"remy", "remy"}, {"ratatouille", "remy"},
            {"spaceship earth", "spaceship_earth"}, {"soarin", "soarin"},
            {"living with the land", "living_land"}, {"figment", "figment"}, {"imagination", "figment"},
            {"mission: space", "mission_space"}, {"mission space", "mission_space"},
            {"nemo & friends", "seas_nemo"}, {"seas with nemo", "seas_nemo"}, {"turtle talk", "seas_nemo"},
            {"journey of water", "journey_water"}, {"moana", "journey_water"}, {"gran fiesta", "gran_fiesta"},
            {"three caballeros", "gran_fiesta"},
            // Hollywood Studios
            {"rise of the resistance", "rise_resistance"}, {"millennium falcon", "millennium_falcon"},
            {"smugglers run", "millennium_falcon"}, {"tower of terror", "tower_terror"},
            {"twilight zone", "tower_terror"}, {"slinky dog", "slinky_dog"}, {"rock 'n' roller", "rock_roller"},
            {"aerosmith", "rock_roller"}, {"toy story", "toy_story"}, {"alien swirling", "alien_saucers"},
            {"star tours", "star_tours"}, {"runaway railway", "runaway_railway"},
            {"mickey & minnie", "runaway_railway"}, {"indiana jones", "indiana_jones"},
            {"epic stunt", "indiana_jones"},
            // Animal Kingdom
            {"flight of passage", "flight_passage"}, {"avatar", "flight_passage"}, {"na'vi river", "navi_river"},
            {"everest", "everest"}, {"expedition everest", "everest"}, {"kilimanjaro", "kilimanjaro"},
            {"safari", "kilimanjaro"}, {"kali river", "kali_river"}, {"lion king", "lion_king"},
            {"festival of the lion", "lion_king"}, {"finding nemo", "finding_nemo_show"},
            {"big blue", "finding_nemo_show"}, {"zootopia", "zootopia"}, {"gorilla falls", "gorilla_falls"},
            {"wildlife express", "wildlife_express"},
            // Magic Kingdom misc
            {"railroad", "railroad"}, {"hall of presidents", "hall_presidents"}, {"speedway", "speedway"},
            {"regal carrousel", "carrousel"},
            // Character meets
            {"meet mickey", "meet_mickey"}, {"town square theater", "meet_mickey"},
            {"princess fairytale hall", "meet_princesses"}, {"meet cinderella", "meet_princesses"},
            {"meet princess tiana", "meet_princesses"}, {"royal sommerhus", "meet_anna_elsa"},
            {"meet anna", "meet_anna_elsa"}, {"meet elsa", "meet_anna_elsa"},
            {"red carpet dreams", "meet_characters"}, {"meet olaf", "meet_characters"},
            {"celebrity spotlight", "meet_characters"}, {"adventurers outpost", "meet_characters"},
            {"meet beloved", "meet_characters"},
        };

        const std::pair<const char *, ColorScheme> schemes[] = {
            {"scifi", {{10, 10, 25}, {76, 201, 240}}},
            {"spooky", {{25, 10, 25}, {128, 19, 54}, {255, 255, 255}, {150, 130, 150}}},
            {"pirate", {{20, 15, 10}, {201, 162, 39}, {255, 255, 255}, {180, 160, 130}}},
            {"adventure", {{15, 35, 25}, {149, 213, 178}}},
            {"whimsical", {{40, 35, 50}, {255, 159, 28}, {255, 255, 255}, {200, 190, 210}}},
            {"playful", {{30, 30, 45}, {255, 107, 107}}},
            {"action", {{15, 15, 20}, {255, 65, 54}}},
            {"fantasy", {{25, 20, 35}, {180, 130, 255}, {255, 255, 255}, {190, 180, 200}}},
            {"future", {{15, 20, 30}, {100, 200, 255}}},
            {"starwars", {{5, 5, 10}, {255, 69, 0}}},
            {"avatar", {{5, 20, 25}, {0, 255, 200}}},
            {"classic", {{20, 20, 30}, {255, 215, 0}}},
        };

        const std::pair<const char *, const char *> fontFiles[] = {
            {"scifi", "Orbitron-Bold.ttf"},
            {"spooky", "Creepster-Regular.ttf"},
            {"pirate", "PirataOne-Regular.ttf"},
            {"adventure", "Rye-Regular.ttf"},
            {"whimsical", "FredokaOne-Regular.ttf"},
            {"playful", "LuckiestGuy-Regular.ttf"},
            {"action", "Bangers-Regular.ttf"},
            {"fantasy", "Cinzel-Bold.ttf"},
            {"future", "Exo2-Bold.ttf"},
            {"starwars", "Audiowide-Regular.ttf"},
            {"avatar", "Exo2-Bold.ttf"},
            {"classic", "Cinzel-Bold.ttf"},
        };

        std::string toLower(const std::string &s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        template<size_t N>
        const char *firstMatch(const Mapping (&table)[N], const std::string &name, const char *fallback) {
            const std::string lower = toLower(name);
            for (const auto &m : table) {
                if (lower.find(m.pattern) != std::string::npos) return m.value;
            }
            return fallback;
        }
    }

    std::string themeForRide(const std::string &rideName) {
        return firstMatch(rideThemes, rideName, DEFAULT_THEME);
    }

    std::string imageFolderForRide(const std::string &rideName) {
        return firstMatch(rideImages, rideName, DEFAULT_IMAGE_FOLDER);
    }

    const ColorScheme &colorScheme(const std::string &theme) {
        for (const auto &[id, scheme] : schemes) {
            if (theme == id) return scheme;
        }
        return schemes[std::size(schemes) - 1].second;
    }

    std::string fontFile(const std::string &theme) {
        for (const auto &[id, file] : fontFiles) {
            if (theme == id) return file;
        }
        return fontFiles[std::size(fontFiles) - 1].second;
    }

    Color waitColor(WaitCategory category) {
        switch (category) {
            case WaitCategory::SHORT: return Color{46, 204, 113};
            case WaitCategory::MODERATE: return Color{241, 196, 15};
            case WaitCategory::LONG: return Color{230, 126, 34};
            case WaitCategory::VERY_LONG: return Color{231, 76, 60};
            default: return Color{241, 196, 15};
        }
    }
}
