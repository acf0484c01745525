#pragma once
/**
 * @file rate_limit.hpp
 * @brief Advisory per-range scan throttle.
 *
 * Pure arithmetic over the last-scan time of a range. Nothing here sleeps or
 * blocks; callers decide what to do with a refusal (the CLI prints the wait and
 * moves on). The atomic check-and-set lives in Store::reserve_scan().
 */

#include <chrono>

#include "netroster/device.hpp"

namespace netroster {

struct RateDecision {
    bool allowed{true};
    std::chrono::milliseconds wait{0};   /**< Time left before the range may be scanned again. */
};

/**
 * @brief Decide whether a range last scanned at @p last may be scanned at @p now.
 *
 * An unset @p last always allows. A @p last in the future (clock stepped back)
 * counts as "just scanned".
 */
RateDecision check_rate_limit(Timestamp last, std::chrono::seconds min_interval, Timestamp now);

/** @brief Whole seconds to report for a wait, rounded up so "0 seconds" is never shown. */
long long wait_seconds(const RateDecision& d);

} // namespace netroster
