// ============================================================================
// scanner.cpp — implementation for scanner.hpp
// ============================================================================

#include "netroster/scanner.hpp"
#include "netroster/cidr.hpp"
#include "netroster/log.hpp"
#include "netroster/probe/arp_scan_backend.hpp"
#include "netroster/probe/nmap_backend.hpp"

#include <chrono>

namespace netroster {

Scanner::Scanner(const Config& cfg, BackendList backends)
: cfg_(cfg), backends_(std::move(backends)) {}

BackendList Scanner::default_backends(const Config& cfg) {
    BackendList list;
    list.push_back(std::make_unique<probe::NmapBackend>(cfg, probe::system_resolver(cfg.dns_timeout)));
    list.push_back(std::make_unique<probe::ArpScanBackend>(cfg, probe::system_resolver(cfg.dns_timeout)));
    return list;
}

RateDecision Scanner::check_rate_limit(Timestamp last_scan, Timestamp now) const {
    return netroster::check_rate_limit(last_scan, cfg_.min_scan_interval, now);
}

ScanResult Scanner::scan(const std::string& range, const ScanContext& ctx) {
    const auto started = std::chrono::steady_clock::now();
    ScanResult result;
    result.network = range;

    auto finish = [&](ScanResult& r) -> ScanResult& {
        r.duration_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        r.timestamp  = Clock::now();
        r.device_count = r.devices.size();
        return r;
    };

    if (!parse_cidr(range)) {
        result.error = "invalid network range: '" + range + "' (expected a.b.c.d/len)";
        return finish(result);
    }
    if (backends_.empty()) {
        result.error = "no scanner backends configured";
        return finish(result);
    }

    std::string last_err;
    for (auto& backend : backends_) {
        if (ctx.expired()) {
            last_err = std::string("scan ") + ctx.reason();
            break;
        }

        std::vector<Device> devices;
        std::string err;
        probe::ProbeStatus st = backend->probe(range, ctx, devices, err);

        if (st == probe::ProbeStatus::Ok) {
            result.success = true;
            result.scanner = backend->name();
            result.devices = std::move(devices);
            finish(result);
            logger()->info("scan {}: {} devices via {} in {:.2f}s",
                           range, result.device_count, result.scanner, result.duration_s);
            return result;
        }

        if (st == probe::ProbeStatus::Unavailable)
            logger()->debug("backend {} {}: {}", backend->name(), probe::to_string(st), err);
        else
            logger()->info("backend {} {}: {}", backend->name(), probe::to_string(st), err);
        last_err = err.empty() ? std::string(backend->name()) + " failed" : err;

        if (ctx.expired()) {
            last_err = std::string("scan ") + ctx.reason();
            break;
        }
    }

    result.error = last_err;
    logger()->warn("scan {} failed: {}", range, result.error);
    return finish(result);
}

} // namespace netroster
