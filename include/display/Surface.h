#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief 24-bit RGB colour.
 */
struct Color {
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};

    bool operator==(const Color &o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Color &o) const { return !(*this == o); }
};

/**
 * @brief Off-screen RGB frame buffer.
 *
 * Cards, snapshots and animation frames are composed on a Surface and
 * handed to the display backend as a whole. Out-of-range drawing is clipped.
 */
class Surface {
public:
    Surface() = default;

    Surface(int width, int height, Color fill = Color{});

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return pixels_.empty(); }

    Color pixel(int x, int y) const;
    void setPixel(int x, int y, Color color);

    /** Blend color over one pixel with alpha 0-255. */
    void blendPixel(int x, int y, Color color, int alpha);

    void fill(Color color);

    void fillRect(int x, int y, int w, int h, Color color, int alpha = 255);

    void fillCircle(int cx, int cy, int radius, Color color, int alpha = 255);

    void drawLine(int x0, int y0, int x1, int y1, Color color, int thickness = 1);

    /**
     * @brief Copy src with its top-left corner at (x, y), blended with alpha.
     */
    void blit(const Surface &src, int x, int y, int alpha = 255);

    /**
     * @brief Nearest-neighbour copy of src stretched over the whole surface.
     */
    void blitScaled(const Surface &src);

    const std::vector<Color> &pixels() const { return pixels_; }

private:
    int width_{0};
    int height_{0};
    std::vector<Color> pixels_;
};

/**
 * @brief Read a binary PPM (P6, maxval 255) image.
 * @param path File path
 * @param out Decoded image
 * @return false if the file is missing or not a supported PPM
 */
bool loadPpm(const std::string &path, Surface &out);
