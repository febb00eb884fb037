#include "display/Surface.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

Surface::Surface(int width, int height, Color fill)
    : width_{std::max(0, width)}, height_{std::max(0, height)},
      pixels_(static_cast<size_t>(width_) * static_cast<size_t>(height_), fill) {
}

Color Surface::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return Color{};
    return pixels_[static_cast<size_t>(y) * width_ + x];
}

void Surface::setPixel(int x, int y, Color color) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
    pixels_[static_cast<size_t>(y) * width_ + x] = color;
}

void Surface::blendPixel(int x, int y, Color color, int alpha) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_ || alpha <= 0) return;
    Color &dst = pixels_[static_cast<size_t>(y) * width_ + x];
    if (alpha >= 255) {
        dst = color;
        return;
    }
    dst.r = static_cast<uint8_t>((color.r * alpha + dst.r * (255 - alpha)) / 255);
    dst.g = static_cast<uint8_t>((color.g * alpha + dst.g * (255 - alpha)) / 255);
    dst.b = static_cast<uint8_t>((color.b * alpha + dst.b * (255 - alpha)) / 255);
}

void Surface::fill(Color color) {
    std::fill(pixels_.begin(), pixels_.end(), color);
}

void Surface::fillRect(int x, int y, int w, int h, Color color, int alpha) {
    const int x0 = std::max(0, x);
    const int y0 = std::max(0, y);
    const int x1 = std::min(width_, x + w);
    const int y1 = std::min(height_, y + h);
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            blendPixel(px, py, color, alpha);
        }
    }
}

void Surface::fillCircle(int cx, int cy, int radius, Color color, int alpha) {
    if (radius <= 0) {
        blendPixel(cx, cy, color, alpha);
        return;
    }
    const int r2 = radius * radius;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= r2) {
                blendPixel(cx + dx, cy + dy, color, alpha);
            }
        }
    }
}

void Surface::drawLine(int x0, int y0, int x1, int y1, Color color, int thickness) {
    // Bresenham, thickened with a square brush
    const int dx = std::abs(x1 - x0);
    const int dy = -std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    const int half = std::max(0, thickness - 1) / 2;
    int err = dx + dy;

    while (true) {
        for (int ty = -half; ty <= half; ++ty) {
            for (int tx = -half; tx <= half; ++tx) {
                setPixel(x0 + tx, y0 + ty, color);
            }
        }
        if (x0 == x1 && y0 == y1) break;
        const int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x0 += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y0 += sy;
        }
    }
}

void Surface::blit(const Surface &src, int x, int y, int alpha) {
    const int x0 = std::max(0, x);
    const int y0 = std::max(0, y);
    const int x1 = std::min(width_, x + src.width_);
    const int y1 = std::min(height_, y + src.height_);
    for (int py = y0; py < y1; ++py) {
        for (int px = x0; px < x1; ++px) {
            blendPixel(px, py, src.pixels_[static_cast<size_t>(py - y) * src.width_ + (px - x)], alpha);
        }
    }
}

void Surface::blitScaled(const Surface &src) {
    if (src.empty() || empty()) return;
    for (int py = 0; py < height_; ++py) {
        const int sy = static_cast<int>(static_cast<int64_t>(py) * src.height_ / height_);
        for (int px = 0; px < width_; ++px) {
            const int sx = static_cast<int>(static_cast<int64_t>(px) * src.width_ / width_);
            pixels_[static_cast<size_t>(py) * width_ + px] = src.pixels_[static_cast<size_t>(sy) * src.width_ + sx];
        }
    }
}

namespace {
    // Next whitespace-separated header token, skipping # comments
    bool readPpmToken(std::istream &in, std::string &token) {
        token.clear();
        char c;
        while (in.get(c)) {
            if (c == '#') {
                std::string ignored;
                std::getline(in, ignored);
                continue;
            }
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (!token.empty()) return true;
                continue;
            }
            token.push_back(c);
        }
        return !token.empty();
    }
}

bool loadPpm(const std::string &path, Surface &out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    std::string magic, w, h, maxval;
    if (!readPpmToken(in, magic) || magic != "P6") return false;
    if (!readPpmToken(in, w) || !readPpmToken(in, h) || !readPpmToken(in, maxval)) return false;

    char *end;
    const long width = strtol(w.c_str(), &end, 10);
    if (*end != '\0' || width <= 0 || width > 8192) return false;
    const long height = strtol(h.c_str(), &end, 10);
    if (*end != '\0' || height <= 0 || height > 8192) return false;
    if (maxval != "255") return false;

    std::vector<uint8_t> raw(static_cast<size_t>(width) * static_cast<size_t>(height) * 3);
    in.read(reinterpret_cast<char *>(raw.data()), static_cast<std::streamsize>(raw.size()));
    if (in.gcount() != static_cast<std::streamsize>(raw.size())) {
        return false;
    }

    Surface image(static_cast<int>(width), static_cast<int>(height));
    for (long y = 0; y < height; ++y) {
        for (long x = 0; x < width; ++x) {
            const size_t i = (static_cast<size_t>(y) * width + x) * 3;
            image.setPixel(static_cast<int>(x), static_cast<int>(y), Color{raw[i], raw[i + 1], raw[i + 2]});
        }
    }
    out = std::move(image);
    return true;
}
