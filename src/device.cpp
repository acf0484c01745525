// ============================================================================
// device.cpp — implementation for device.hpp
// For the record layout see the matching .hpp.
// ============================================================================

#include "netroster/device.hpp"

namespace netroster {

// Field-for-field comparison; used by persistence round-trip checks and tests.
bool operator==(const Device& a, const Device& b) {
    return a.ip == b.ip
        && a.mac == b.mac
        && a.hostname == b.hostname
        && a.vendor == b.vendor
        && a.label == b.label
        && a.notes == b.notes
        && a.group == b.group
        && a.first_seen == b.first_seen
        && a.last_seen == b.last_seen
        && a.response_time_ms == b.response_time_ms;
}

} // namespace netroster
