#pragma once
/**
 * @file scanner.hpp
 * @brief Discovery orchestrator: validate the range, run backends in order, wrap the result.
 *
 * @details
 * PURPOSE
 * -------
 * Scanner owns an ordered list of probe backends (nmap first, arp-scan as
 * fallback by default) and turns one target range into one ScanResult. It
 * holds no device state and takes no locks; merging the result into the
 * inventory is the Store's job.
 *
 * FLOW
 * ----
 *   1. parse_cidr(range) fails         -> success=false, nothing spawned
 *   2. for each backend in order:
 *        Ok                            -> stop, wrap devices
 *        Unavailable / Failed          -> remember error, try next
 *        context expired afterwards    -> stop, report "scan cancelled" / "scan timed out"
 *   3. all backends failed             -> success=false, last error
 *
 * EXAMPLE
 * -------
 * @code
 *   netroster::Scanner scanner(cfg, netroster::Scanner::default_backends(cfg));
 *   netroster::ScanContext ctx(cfg.scan_timeout);
 *   auto r = scanner.scan("192.168.1.0/24", ctx);
 *   if (r.success) store.merge_devices(r.devices, err);
 * @endcode
 */

#include <memory>
#include <string>
#include <vector>

#include "netroster/config.hpp"
#include "netroster/device.hpp"
#include "netroster/probe/probe_backend.hpp"
#include "netroster/rate_limit.hpp"
#include "netroster/scan_context.hpp"

namespace netroster {

using BackendList = std::vector<std::unique_ptr<probe::IProbeBackend>>;

class Scanner {
public:
    Scanner(const Config& cfg, BackendList backends);

    /** nmap then arp-scan, both resolving names with the configured DNS timeout. */
    static BackendList default_backends(const Config& cfg);

    /** Never throws; every failure is reported through ScanResult. */
    ScanResult scan(const std::string& range, const ScanContext& ctx);

    /** check_rate_limit() with the configured minimum interval. */
    RateDecision check_rate_limit(Timestamp last_scan, Timestamp now = Clock::now()) const;

    std::size_t backend_count() const { return backends_.size(); }

private:
    const Config& cfg_;
    BackendList backends_;
};

} // namespace netroster
