#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <ft2build.h>
#include FT_FREETYPE_H

#include "display/TextRenderer.h"

/**
 * @brief FreeType text rendering with per-theme typefaces.
 *
 * Theme fonts are looked up in <assets>/fonts. When a theme's file is
 * missing the first loadable fallback font is used instead; with no
 * usable font at all text is skipped and a warning is logged once.
 * Faces are opened on first use and kept until destruction.
 */
class FontManager : public TextRenderer {
public:
    /** System fonts tried when a theme font is missing. */
    static const std::vector<std::string> &systemFonts();

    /**
     * @param assetsDir Directory containing fonts/
     * @param fallbackFonts Font files tried in order when a theme font is missing
     * @throws display_exception If FreeType cannot be initialised
     */
    explicit FontManager(const std::string &assetsDir,
                         std::vector<std::string> fallbackFonts = systemFonts());

    ~FontManager() override;

    FontManager(const FontManager &) = delete;
    FontManager &operator=(const FontManager &) = delete;

    int textWidth(const std::string &text, int pixelSize, const std::string &theme) override;

    int drawText(Surface &surface, const std::string &text, int x, int y, int pixelSize, Color color,
                 const std::string &theme) override;

    /** True when the theme resolves to a loadable face (its own or a fallback). */
    bool hasFont(const std::string &theme);

    /** Decode UTF-8; malformed bytes become U+FFFD. */
    static std::vector<char32_t> decodeUtf8(const std::string &text);

private:
    static constexpr auto tag_{"FontManager"};

    std::string fontsDir_;
    std::vector<std::string> fallbackFonts_;

    std::mutex mutex_;
    FT_Library library_{nullptr};
    std::map<std::string, FT_Face> faces_;  ///< by file path
    std::map<std::string, bool> missing_;   ///< paths that failed to open
    bool warnedNoFont_{false};

    FT_Face openFace(const std::string &path);
    FT_Face faceForTheme(const std::string &theme);
    int measureLocked(FT_Face face, const std::vector<char32_t> &codepoints);
};
