#pragma once

#include <chrono>
#include <thread>

/**
 * @brief Paces the render loop to a target frame rate.
 *
 * tick() sleeps out the rest of the frame budget and returns the real
 * time since the previous tick, so a slow frame yields a larger dt.
 */
class FrameClock {
public:
    explicit FrameClock(unsigned fps)
        : frameBudget_{std::chrono::duration<double>(1.0 / (fps > 0 ? fps : 1))},
          last_{std::chrono::steady_clock::now()} {
    }

    double tick() {
        const auto deadline = last_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(frameBudget_);
        const auto now = std::chrono::steady_clock::now();
        if (now < deadline) {
            std::this_thread::sleep_until(deadline);
        }
        const auto current = std::chrono::steady_clock::now();
        const double dt = std::chrono::duration<double>(current - last_).count();
        last_ = current;
        return dt;
    }

private:
    std::chrono::duration<double> frameBudget_;
    std::chrono::steady_clock::time_point last_;
};
