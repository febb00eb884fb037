#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "logging/Logger.h"

/**
 * @brief Background thread that runs a job every interval until stopped.
 *
 * stop() wakes the thread immediately (no waiting out the interval) and
 * joins it. A job that throws is logged and the schedule continues.
 */
class PeriodicTask {
public:
    using Job = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Job job, bool runImmediately = false)
        : name_{std::move(name)}, interval_{interval}, job_{std::move(job)}, runImmediately_{runImmediately} {
    }

    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask &) = delete;
    PeriodicTask &operator=(const PeriodicTask &) = delete;

    void start() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (running_) return;
            running_ = true;
        }
        thread_ = std::thread([this]() {
            Logger::debug(Logger::Source::Refresh, name_.c_str(), "started, every %lld ms",
                          static_cast<long long>(interval_.count()));
            bool first = true;
            while (true) {
                if (!(first && runImmediately_)) {
                    std::unique_lock<std::mutex> lock(mtx_);
                    if (cv_.wait_for(lock, interval_, [this]() { return !running_; })) {
                        break;
                    }
                }
                first = false;
                runJob();
                std::lock_guard<std::mutex> lock(mtx_);
                if (!running_) break;
            }
            Logger::debug(Logger::Source::Refresh, name_.c_str(), "stopped");
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            running_ = false;
        }
        cv_.notify_one();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return running_;
    }

private:
    std::string name_;
    std::chrono::milliseconds interval_;
    Job job_;
    bool runImmediately_;

    bool running_{false};
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::thread thread_;

    void runJob() {
        try {
            job_();
        } catch (const std::exception &e) {
            Logger::error(Logger::Source::Refresh, name_.c_str(), "job failed: %s", e.what());
        }
    }
};
