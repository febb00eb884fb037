#include "animation/FireworksDriver.h"
#include "core/Constants.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace {
    constexpr Color PALETTE[] = {
        {255, 215, 0}, {255, 105, 180}, {0, 255, 255}, {255, 69, 0},
        {50, 205, 50}, {255, 255, 255}, {147, 112, 219}, {255, 165, 0},
    };

    constexpr double PI{3.14159265358979323846};

    uint8_t clampChannel(int v) {
        return static_cast<uint8_t>(std::clamp(v, 0, 255));
    }

    Color scaled(Color c, float factor) {
        return Color{clampChannel(static_cast<int>(c.r * factor)),
                     clampChannel(static_cast<int>(c.g * factor)),
                     clampChannel(static_cast<int>(c.b * factor))};
    }
}

FireworksDriver::FireworksDriver(int width, int height, uint32_t seed)
    : width_{width}, height_{height}, rng_{seed} {
}

float FireworksDriver::uniform(float lo, float hi) {
    return std::uniform_real_distribution<float>(lo, hi)(rng_);
}

void FireworksDriver::reset() {
    rockets_.clear();
    lastLaunch_ = 0.0;
    launchInterval_ = 0.3;
}

void FireworksDriver::launch() {
    std::uniform_int_distribution<size_t> pick(0, std::size(PALETTE) - 1);
    Rocket rocket;
    rocket.x = uniform(width_ * 0.1f, width_ * 0.9f);
    rocket.y = static_cast<float>(height_ + 10);
    rocket.targetY = uniform(height_ * 0.15f, height_ * 0.4f);
    rocket.vy = -uniform(12.0f, 16.0f);
    rocket.color = PALETTE[pick(rng_)];
    rockets_.push_back(std::move(rocket));
}

void FireworksDriver::explode(Rocket &rocket) {
    rocket.exploded = true;
    const int count = std::uniform_int_distribution<int>(60, 100)(rng_);
    std::uniform_int_distribution<int> jitter(-30, 30);
    rocket.particles.reserve(static_cast<size_t>(count));

    for (int i = 0; i < count; ++i) {
        const float angle = uniform(0.0f, static_cast<float>(2.0 * PI));
        const float speed = uniform(2.0f, 8.0f);
        Particle p;
        p.x = rocket.x;
        p.y = rocket.y;
        p.vx = std::cos(angle) * speed;
        p.vy = std::sin(angle) * speed;
        p.color = Color{clampChannel(rocket.color.r + jitter(rng_)),
                        clampChannel(rocket.color.g + jitter(rng_)),
                        clampChannel(rocket.color.b + jitter(rng_))};
        p.size = uniform(2.0f, 4.0f);
        p.decay = uniform(0.01f, 0.025f);
        rocket.particles.push_back(p);
    }
}

void FireworksDriver::update(double dt, double elapsed) {
    const float step = static_cast<float>(dt) * Constants::Animation::FRAME_RATE_BASE;
    const float gravity = Constants::Animation::GRAVITY;

    if (elapsed - lastLaunch_ > launchInterval_) {
        launch();
        lastLaunch_ = elapsed;
        launchInterval_ = uniform(0.2f, 0.6f);
    }

    for (auto &rocket : rockets_) {
        if (!rocket.exploded) {
            rocket.y += rocket.vy * step;
            rocket.vy += gravity * 0.3f;
            if (rocket.y <= rocket.targetY || rocket.vy >= 0.0f) {
                explode(rocket);
            }
            continue;
        }
        for (auto &p : rocket.particles) {
            p.x += p.vx * step;
            p.y += p.vy * step;
            p.vy += gravity;
            p.life -= p.decay * step;
        }
        rocket.particles.erase(std::remove_if(rocket.particles.begin(), rocket.particles.end(),
                                              [](const Particle &p) { return p.life <= 0.0f; }),
                               rocket.particles.end());
    }

    rockets_.erase(std::remove_if(rockets_.begin(), rockets_.end(),
                                  [](const Rocket &r) { return r.exploded && r.particles.empty(); }),
                   rockets_.end());
}

void FireworksDriver::render(Surface &surface) const {
    for (const auto &rocket : rockets_) {
        if (!rocket.exploded) {
            const int x = static_cast<int>(rocket.x);
            const int y = static_cast<int>(rocket.y);
            surface.fillCircle(x, y, 3, rocket.color);
            surface.fillCircle(x, y + 5, 2, scaled(rocket.color, 0.5f));
            continue;
        }
        for (const auto &p : rocket.particles) {
            const int size = static_cast<int>(p.size * p.life);
            if (size <= 0) {
                continue;
            }
            surface.fillCircle(static_cast<int>(p.x), static_cast<int>(p.y), std::max(1, size),
                               scaled(p.color, p.life));
        }
    }
}
