#include "display/FontManager.h"
#include "display/DisplayException.h"
#include "display/ThemeCatalog.h"
#include "logging/Logger.h"

#include <utility>

namespace {
    constexpr char32_t REPLACEMENT_CHAR{0xFFFD};

    int toPixels(FT_Pos value) {
        return static_cast<int>(value >> 6);
    }
}

const std::vector<std::string> &FontManager::systemFonts() {
    static const std::vector<std::string> fonts{
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
        "/usr/share/fonts/liberation/LiberationSans-Bold.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSansBold.ttf",
    };
    return fonts;
}

FontManager::FontManager(const std::string &assetsDir, std::vector<std::string> fallbackFonts)
    : fontsDir_{assetsDir + "/fonts"}, fallbackFonts_{std::move(fallbackFonts)} {
    const FT_Error err = FT_Init_FreeType(&library_);
    if (err != 0) {
        throw display_exception("FT_Init_FreeType failed (error " + std::to_string(err) + ")");
    }
}

FontManager::~FontManager() {
    for (auto &[path, face] : faces_) {
        FT_Done_Face(face);
    }
    FT_Done_FreeType(library_);
}

std::vector<char32_t> FontManager::decodeUtf8(const std::string &text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t extra;
        char32_t cp;
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        if (i + extra >= text.size()) {
            // Truncated sequence at the end of the string
            out.push_back(REPLACEMENT_CHAR);
            break;
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (!valid) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

FT_Face FontManager::openFace(const std::string &path) {
    auto it = faces_.find(path);
    if (it != faces_.end()) {
        return it->second;
    }
    if (missing_.count(path) != 0) {
        return nullptr;
    }

    FT_Face face = nullptr;
    if (FT_New_Face(library_, path.c_str(), 0, &face) != 0) {
        Logger::debug(Logger::Source::Display, tag_, "Font not loadable: %s", path.c_str());
        missing_[path] = true;
        return nullptr;
    }
    Logger::info(Logger::Source::Display, tag_, "Loaded font %s", path.c_str());
    faces_[path] = face;
    return face;
}

FT_Face FontManager::faceForTheme(const std::string &theme) {
    if (FT_Face face = openFace(fontsDir_ + "/" + ThemeCatalog::fontFile(theme))) {
        return face;
    }
    for (const auto &path : fallbackFonts_) {
        if (FT_Face face = openFace(path)) {
            return face;
        }
    }
    if (!warnedNoFont_) {
        Logger::warn(Logger::Source::Display, tag_, "No usable font in %s or system paths, text disabled",
                     fontsDir_.c_str());
        warnedNoFont_ = true;
    }
    return nullptr;
}

bool FontManager::hasFont(const std::string &theme) {
    std::lock_guard<std::mutex> lock(mutex_);
    return faceForTheme(theme) != nullptr;
}

int FontManager::measureLocked(FT_Face face, const std::vector<char32_t> &codepoints) {
    int width = 0;
    for (char32_t cp : codepoints) {
        if (FT_Load_Char(face, cp, FT_LOAD_DEFAULT) != 0) continue;
        width += toPixels(face->glyph->advance.x);
    }
    return width;
}

int FontManager::textWidth(const std::string &text, int pixelSize, const std::string &theme) {
    std::lock_guard<std::mutex> lock(mutex_);
    FT_Face face = faceForTheme(theme);
    if (face == nullptr || FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(pixelSize)) != 0) {
        return 0;
    }
    return measureLocked(face, decodeUtf8(text));
}

int FontManager::drawText(Surface &surface, const std::string &text, int x, int y, int pixelSize, Color color,
                          const std::string &theme) {
    std::lock_guard<std::mutex> lock(mutex_);
    FT_Face face = faceForTheme(theme);
    if (face == nullptr || FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(pixelSize)) != 0) {
        return 0;
    }

    const int baseline = y + toPixels(face->size->metrics.ascender);
    int penX = x;
    for (char32_t cp : decodeUtf8(text)) {
        if (FT_Load_Char(face, cp, FT_LOAD_RENDER) != 0) continue;

        const FT_GlyphSlot glyph = face->glyph;
        const FT_Bitmap &bitmap = glyph->bitmap;
        const int left = penX + glyph->bitmap_left;
        const int top = baseline - glyph->bitmap_top;

        // Gray bitmaps only; coverage is the blend alpha
        if (bitmap.pixel_mode == FT_PIXEL_MODE_GRAY) {
            for (unsigned row = 0; row < bitmap.rows; ++row) {
                const unsigned char *line = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
                for (unsigned col = 0; col < bitmap.width; ++col) {
                    if (line[col] != 0) {
                        surface.blendPixel(left + static_cast<int>(col), top + static_cast<int>(row), color,
                                           line[col]);
                    }
                }
            }
        }
        penX += toPixels(glyph->advance.x);
    }
    return penX - x;
}
