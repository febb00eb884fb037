#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "animation/AnimationDriver.h"

/**
 * @brief Balloons, confetti and twinkling stars under a sparkle banner.
 */
class ParadeDriver : public AnimationDriver {
public:
    enum class ElementKind {
        BALLOON,
        CONFETTI,
        STAR
    };

    struct Element {
        ElementKind kind{ElementKind::BALLOON};
        float x{0}, y{0};
        float vx{0}, vy{0};
        Color color;
        float size{10};
        float rotation{0};
        float rotationSpeed{0};
    };

    ParadeDriver(int width, int height, uint32_t seed = std::random_device{}());

    void reset() override;
    void update(double dt, double elapsed) override;
    void render(Surface &surface) const override;

    const std::vector<Element> &elements() const { return elements_; }
    double bannerOffset() const { return bannerOffset_; }

private:
    int width_;
    int height_;
    std::mt19937 rng_;

    std::vector<Element> elements_;
    double spawnTimer_{0.0};
    double spawnInterval_{0.1};
    double bannerOffset_{0.0};
    double elapsed_{0.0};

    float uniform(float lo, float hi);
    void spawn();

    void drawBalloon(Surface &surface, const Element &e) const;
    void drawConfetti(Surface &surface, const Element &e) const;
    void drawStar(Surface &surface, const Element &e) const;
    void drawBanner(Surface &surface) const;
};
