// ============================================================================
// rate_limit.cpp — implementation for rate_limit.hpp
// ============================================================================

#include "netroster/rate_limit.hpp"

namespace netroster {

RateDecision check_rate_limit(Timestamp last, std::chrono::seconds min_interval, Timestamp now) {
    using std::chrono::milliseconds;
    RateDecision d;
    if (!is_set(last)) return d;

    auto elapsed = now > last ? std::chrono::duration_cast<milliseconds>(now - last) : milliseconds(0);
    if (elapsed >= min_interval) return d;

    d.allowed = false;
    d.wait = std::chrono::duration_cast<milliseconds>(min_interval) - elapsed;
    return d;
}

long long wait_seconds(const RateDecision& d) {
    if (d.allowed) return 0;
    return (d.wait.count() + 999) / 1000;
}

} // namespace netroster
