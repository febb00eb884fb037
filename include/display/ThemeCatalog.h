#pragma once

#include <string>

#include "display/Surface.h"
#include "model/Ride.h"

/**
 * @brief Colours of one ride theme.
 */
struct ColorScheme {
    Color background;
    Color accent;
    Color textPrimary{255, 255, 255};
    Color textSecondary{180, 180, 180};
};

/**
 * @brief Ride name to theme / image folder lookups.
 *
 * Both tables are ordered (pattern, value) lists matched as
 * case-insensitive substrings; the first matching pattern wins.
 */
namespace ThemeCatalog {
    constexpr const char *DEFAULT_THEME{"classic"};
    constexpr const char *DEFAULT_IMAGE_FOLDER{"generic"};

    std::string themeForRide(const std::string &rideName);

    std::string imageFolderForRide(const std::string &rideName);

    /** Scheme for a theme id; unknown ids get the classic scheme. */
    const ColorScheme &colorScheme(const std::string &theme);

    /** Font file name under <assets>/fonts for a theme; unknown ids get the classic font. */
    std::string fontFile(const std::string &theme);

    Color waitColor(WaitCategory category);
}
