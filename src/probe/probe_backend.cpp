// ============================================================================
// probe/probe_backend.cpp — implementation for probe/probe_backend.hpp
// ============================================================================

#include "netroster/probe/probe_backend.hpp"

namespace netroster::probe {

const char* to_string(ProbeStatus s) {
    switch (s) {
        case ProbeStatus::Ok:          return "ok";
        case ProbeStatus::Unavailable: return "unavailable";
        case ProbeStatus::Failed:      return "failed";
    }
    return "unknown";
}

} // namespace netroster::probe
