#pragma once

#include <string>

#include "display/Surface.h"

/**
 * @brief Draws UTF-8 text onto a Surface.
 *
 * theme selects the typeface (see ThemeCatalog::fontFile). Positions are
 * the top-left corner of the text line.
 */
class TextRenderer {
public:
    virtual ~TextRenderer() = default;

    /** Advance width in pixels of text at pixelSize. */
    virtual int textWidth(const std::string &text, int pixelSize, const std::string &theme) = 0;

    /**
     * @brief Draw one line of text.
     * @return Advance width in pixels
     */
    virtual int drawText(Surface &surface, const std::string &text, int x, int y, int pixelSize, Color color,
                         const std::string &theme) = 0;
};
