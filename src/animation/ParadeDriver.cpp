#include "animation/ParadeDriver.h"
#include "core/Constants.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace {
    constexpr Color PALETTE[] = {
        {255, 0, 0}, {255, 165, 0}, {255, 255, 0}, {0, 255, 0},
        {0, 191, 255}, {138, 43, 226}, {255, 20, 147}, {255, 215, 0},
    };

    constexpr Color STAR_COLOR{255, 255, 200};
    constexpr Color STRING_COLOR{150, 150, 150};
    constexpr Color BANNER_COLOR{40, 20, 70};

    Color scaled(Color c, double factor) {
        return Color{static_cast<uint8_t>(c.r * factor), static_cast<uint8_t>(c.g * factor),
                     static_cast<uint8_t>(c.b * factor)};
    }

    Color highlight(Color c) {
        return Color{static_cast<uint8_t>(std::min(255, c.r + 80)),
                     static_cast<uint8_t>(std::min(255, c.g + 80)),
                     static_cast<uint8_t>(std::min(255, c.b + 80))};
    }
}

ParadeDriver::ParadeDriver(int width, int height, uint32_t seed)
    : width_{width}, height_{height}, rng_{seed} {
}

float ParadeDriver::uniform(float lo, float hi) {
    return std::uniform_real_distribution<float>(lo, hi)(rng_);
}

void ParadeDriver::reset() {
    elements_.clear();
    spawnTimer_ = 0.0;
    spawnInterval_ = 0.1;
    bannerOffset_ = 0.0;
    elapsed_ = 0.0;
}

void ParadeDriver::spawn() {
    // balloon 30%, confetti 50%, star 20%
    std::discrete_distribution<int> kind({3, 5, 2});
    std::uniform_int_distribution<size_t> pick(0, std::size(PALETTE) - 1);
    std::uniform_int_distribution<int> column(0, width_);

    Element e;
    e.x = static_cast<float>(column(rng_));
    e.color = PALETTE[pick(rng_)];

    switch (kind(rng_)) {
        case 0:
            e.kind = ElementKind::BALLOON;
            e.y = static_cast<float>(height_ + 20);
            e.vx = uniform(-0.5f, 0.5f);
            e.vy = uniform(-3.0f, -1.5f);
            e.size = uniform(15.0f, 25.0f);
            break;
        case 1:
            e.kind = ElementKind::CONFETTI;
            e.y = -10.0f;
            e.vx = uniform(-1.0f, 1.0f);
            e.vy = uniform(2.0f, 4.0f);
            e.size = uniform(6.0f, 12.0f);
            e.rotationSpeed = uniform(-5.0f, 5.0f);
            break;
        default:
            e.kind = ElementKind::STAR;
            e.y = static_cast<float>(std::uniform_int_distribution<int>(0, static_cast<int>(height_ * 0.6))(rng_));
            e.color = STAR_COLOR;
            e.size = uniform(3.0f, 8.0f);
            break;
    }
    elements_.push_back(e);
}

void ParadeDriver::update(double dt, double elapsed) {
    const float step = static_cast<float>(dt) * Constants::Animation::FRAME_RATE_BASE;
    elapsed_ = elapsed;
    if (width_ > 0) {
        bannerOffset_ = std::fmod(elapsed * Constants::Animation::BANNER_SPEED, static_cast<double>(width_));
    }

    spawnTimer_ += dt;
    if (spawnTimer_ > spawnInterval_) {
        spawn();
        spawnTimer_ = 0.0;
        spawnInterval_ = uniform(0.05f, 0.15f);
    }

    for (auto &e : elements_) {
        e.x += e.vx * step;
        e.y += e.vy * step;
        e.rotation += e.rotationSpeed * step;
        if (e.kind == ElementKind::BALLOON) {
            e.x += static_cast<float>(std::sin(elapsed * 2.0 + e.y * 0.05) * 0.5);
        }
    }

    const float margin = Constants::Animation::OFFSCREEN_MARGIN;
    const float w = static_cast<float>(width_);
    const float h = static_cast<float>(height_);
    elements_.erase(std::remove_if(elements_.begin(), elements_.end(),
                                   [&](const Element &e) {
                                       return e.x < -margin || e.x > w + margin ||
                                              e.y < -margin || e.y > h + margin;
                                   }),
                    elements_.end());
}

void ParadeDriver::render(Surface &surface) const {
    for (const auto &e : elements_) {
        switch (e.kind) {
            case ElementKind::BALLOON: drawBalloon(surface, e); break;
            case ElementKind::CONFETTI: drawConfetti(surface, e); break;
            case ElementKind::STAR: drawStar(surface, e); break;
        }
    }
    drawBanner(surface);
}

void ParadeDriver::drawBalloon(Surface &surface, const Element &e) const {
    const int x = static_cast<int>(e.x);
    const int y = static_cast<int>(e.y);
    const int size = static_cast<int>(e.size);
    const int r = size / 2;

    // Two stacked discs give the taller-than-wide body
    surface.fillCircle(x, y - size + r, r, e.color);
    surface.fillCircle(x, y - size + r + r / 3, r, e.color);
    surface.fillCircle(x - size / 8, y - size + 5 + size / 6, std::max(1, size / 6), highlight(e.color));
    surface.drawLine(x, y + static_cast<int>(size * 0.3), x, y + size, STRING_COLOR);
}

void ParadeDriver::drawConfetti(Surface &surface, const Element &e) const {
    const float c = std::cos(e.rotation);
    const float s = std::sin(e.rotation);
    const int dx = static_cast<int>(e.size * c);
    const int dy = static_cast<int>(e.size * s);
    const int x = static_cast<int>(e.x);
    const int y = static_cast<int>(e.y);
    surface.drawLine(x - dx, y - dy, x + dx, y + dy, e.color, std::max(1, static_cast<int>(e.size / 2)));
}

void ParadeDriver::drawStar(Surface &surface, const Element &e) const {
    const double twinkle = (std::sin(elapsed_ * 8.0 + e.x + e.y) + 1.0) / 2.0;
    if (twinkle < 0.3) {
        return;
    }
    const Color color = scaled(e.color, twinkle);
    const int x = static_cast<int>(e.x);
    const int y = static_cast<int>(e.y);
    const int size = static_cast<int>(e.size);
    const int half = size / 2;

    surface.drawLine(x - size, y, x + size, y, color, 2);
    surface.drawLine(x, y - size, x, y + size, color, 2);
    surface.drawLine(x - half, y - half, x + half, y + half, color);
    surface.drawLine(x - half, y + half, x + half, y - half, color);
}

void ParadeDriver::drawBanner(Surface &surface) const {
    const int bannerHeight = Constants::Animation::BANNER_HEIGHT;
    const int sparkles = Constants::Animation::BANNER_SPARKLES;
    surface.fillRect(0, 0, width_, bannerHeight, BANNER_COLOR, 180);

    for (int i = 0; i < sparkles; ++i) {
        const int x = static_cast<int>(std::fmod(static_cast<double>(i) * width_ / sparkles + bannerOffset_,
                                                 static_cast<double>(std::max(width_, 1))));
        const int y = static_cast<int>(bannerHeight / 2 + std::sin(elapsed_ * 4.0 + i) * 10.0);

        const double intensity = (std::sin(elapsed_ * 6.0 + i * 0.5) + 1.0) / 2.0;
        if (intensity > 0.5) {
            const Color color{static_cast<uint8_t>(255 * intensity), static_cast<uint8_t>(215 * intensity),
                              static_cast<uint8_t>(50 * intensity)};
            surface.fillCircle(x, y, static_cast<int>(3 + intensity * 3), color);
        }
    }
}
