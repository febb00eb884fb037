#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "animation/AnimationDriver.h"

/**
 * @brief Rockets rise from the bottom edge and burst into particles.
 */
class FireworksDriver : public AnimationDriver {
public:
    struct Particle {
        float x{0}, y{0};
        float vx{0}, vy{0};
        Color color;
        float life{1.0f};
        float size{2.0f};
        float decay{0.02f};
    };

    struct Rocket {
        float x{0}, y{0};
        float vy{0};
        float targetY{0};
        Color color;
        bool exploded{false};
        std::vector<Particle> particles;
    };

    FireworksDriver(int width, int height, uint32_t seed = std::random_device{}());

    void reset() override;
    void update(double dt, double elapsed) override;
    void render(Surface &surface) const override;

    const std::vector<Rocket> &rockets() const { return rockets_; }

private:
    int width_;
    int height_;
    std::mt19937 rng_;

    std::vector<Rocket> rockets_;
    double lastLaunch_{0.0};
    double launchInterval_{0.3};

    float uniform(float lo, float hi);
    void launch();
    void explode(Rocket &rocket);
};
