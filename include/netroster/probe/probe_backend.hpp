#pragma once
/**
 * @file probe_backend.hpp
 * @brief Minimal interface every host-discovery backend implements.
 *
 * The Scanner holds an ordered list of these and tries them in turn; it never
 * knows which tool is behind one. Adding a backend means one new class and one
 * new line where the list is built.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "netroster/device.hpp"
#include "netroster/scan_context.hpp"

namespace netroster::probe {

/**
 * Outcome of one probe attempt.
 *  - Ok:          @p out holds the discovered devices (possibly none).
 *  - Unavailable: the tool is not installed; try the next backend.
 *  - Failed:      the tool ran and failed (non-zero exit, unparsable output,
 *                 timeout/cancel).
 */
enum class ProbeStatus : uint8_t { Ok = 0, Unavailable = 1, Failed = 2 };

const char* to_string(ProbeStatus s);

/**
 * @brief Backend contract.
 *
 *  - name() is a short identifier reported in ScanResult::scanner and logs.
 *  - probe() runs one discovery over @p range (already validated CIDR text),
 *    bounded by @p ctx. On anything but Ok, @p err says why.
 */
class IProbeBackend {
public:
    virtual ~IProbeBackend() = default;
    virtual const char* name() const = 0;
    virtual ProbeStatus probe(const std::string& range,
                              const ScanContext& ctx,
                              std::vector<Device>& out,
                              std::string& err) = 0;
};

} // namespace netroster::probe
