#pragma once
/**
 * @file scan_context.hpp
 * @brief Deadline + cancellation flag carried through one scan.
 *
 * Copies share the same flag, so a caller can keep one copy, hand another to
 * Scanner::scan() on a worker thread, and call cancel() from anywhere. The
 * process runner checks expired() between poll slices and tears the external
 * tool down as soon as it turns true.
 */

#include <atomic>
#include <chrono>
#include <memory>

namespace netroster {

class ScanContext {
public:
    using SteadyClock = std::chrono::steady_clock;

    /** No deadline; only cancel() ends it. */
    ScanContext()
    : deadline_(SteadyClock::time_point::max()),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    explicit ScanContext(std::chrono::milliseconds budget)
    : deadline_(SteadyClock::now() + budget),
      cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { cancelled_->store(true); }
    bool cancelled() const { return cancelled_->load(); }
    bool timed_out() const { return SteadyClock::now() >= deadline_; }
    bool expired() const { return cancelled() || timed_out(); }

    SteadyClock::time_point deadline() const { return deadline_; }

    /** Milliseconds left before the deadline, clamped at zero. */
    std::chrono::milliseconds remaining() const {
        if (deadline_ == SteadyClock::time_point::max()) return std::chrono::milliseconds::max();
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - SteadyClock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    /** "cancelled" or "timed out"; only meaningful once expired() is true. */
    const char* reason() const { return cancelled() ? "cancelled" : "timed out"; }

private:
    SteadyClock::time_point deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace netroster
