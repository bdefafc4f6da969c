#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>

namespace sonar {
namespace net {

/**
 * @brief Overall time ceiling for one scan, shared by every probe task.
 *
 * Network operations clamp their own timeouts to remaining() and poll
 * expired() between short waits, so cancel() (or the clock running out)
 * makes in-flight socket work give up and close its descriptors.
 *
 * Thread-safe: cancel() may be called from the orchestrator while worker
 * threads are polling.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(std::chrono::milliseconds budget) : expires_at_(Clock::now() + budget) {}

    Deadline(const Deadline &) = delete;
    Deadline &operator=(const Deadline &) = delete;

    void cancel() { cancelled_.store(true); }

    bool cancelled() const { return cancelled_.load(); }

    bool expired() const { return cancelled_.load() || Clock::now() >= expires_at_; }

    Clock::time_point expires_at() const { return expires_at_; }

    std::chrono::milliseconds remaining() const {
        if (cancelled_.load()) {
            return std::chrono::milliseconds(0);
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(expires_at_ - Clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    std::chrono::milliseconds clamp(std::chrono::milliseconds timeout) const { return std::min(timeout, remaining()); }

private:
    Clock::time_point expires_at_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace net
}  // namespace sonar
