// ============================================================================
// probe/arp_scan_backend.cpp — implementation for probe/arp_scan_backend.hpp
// ============================================================================

#include "netroster/probe/arp_scan_backend.hpp"
#include "netroster/cidr.hpp"
#include "netroster/log.hpp"
#include "netroster/network_detect.hpp"
#include "netroster/process.hpp"

#include <set>
#include <sstream>

namespace netroster::probe {

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        parts.push_back(trim(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start)));
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    return parts;
}

// arp-scan prints "(Unknown)" / "(Unknown: locally administered)" when its own
// table has no entry; treat those as "no vendor" so the OUI table gets a go.
static bool is_placeholder_vendor(const std::string& v) {
    return v.rfind("(Unknown", 0) == 0;
}

std::vector<Device> parse_arp_scan_output(const std::string& text) {
    std::vector<Device> devices;
    std::set<std::string> seen;

    std::istringstream in(text);
    std::string raw;
    while (std::getline(in, raw)) {
        const std::string line = trim(raw);
        if (line.empty()) continue;
        if (line.rfind("Interface:", 0) == 0 || line.rfind("Starting", 0) == 0 ||
            line.rfind("Ending", 0) == 0)
            continue;

        auto parts = split_tabs(line);
        if (parts.size() < 2) continue;
        if (!parse_ipv4(parts[0])) {
            logger()->debug("arp-scan: skipping line '{}'", line);
            continue;
        }
        if (!seen.insert(parts[0]).second) continue;     // DUP reply

        Device d;
        d.ip  = parts[0];
        d.mac = parts[1];
        if (parts.size() >= 3 && !is_placeholder_vendor(parts[2])) d.vendor = parts[2];
        devices.push_back(std::move(d));
    }
    return devices;
}

ArpScanBackend::ArpScanBackend(const Config& cfg, ReverseResolver resolve)
: executable_(cfg.arp_scan_path), resolve_(std::move(resolve)) {}

ProbeStatus ArpScanBackend::probe(const std::string& range,
                                  const ScanContext& ctx,
                                  std::vector<Device>& out,
                                  std::string& err) {
    out.clear();
    const std::string exe = find_executable(executable_);
    if (exe.empty()) {
        err = "arp-scan not found";
        return ProbeStatus::Unavailable;
    }

    std::vector<std::string> argv = {exe, "--localnet", "-q"};

    // Pick the interface that carries the range; without one arp-scan uses its default.
    auto net = parse_cidr(range);
    std::vector<InterfaceAddress> ifaces;
    std::string ierr;
    if (net && enumerate_interfaces(ifaces, ierr)) {
        std::string iface = interface_for_range(*net, ifaces);
        if (!iface.empty()) {
            argv.push_back("-I");
            argv.push_back(iface);
        }
    } else if (!ierr.empty()) {
        logger()->debug("arp-scan: interface lookup failed: {}", ierr);
    }

    ProcessResult pr;
    std::string perr;
    if (!run_process(argv, ctx, pr, perr)) {
        err = "arp-scan " + perr;
        return ProbeStatus::Failed;
    }
    if (pr.exit_code != 0) {
        err = "arp-scan failed: exit " + std::to_string(pr.exit_code);
        if (!pr.err_output.empty()) err += ": " + pr.err_output.substr(0, pr.err_output.find('\n'));
        return ProbeStatus::Failed;
    }

    std::vector<Device> devices = parse_arp_scan_output(pr.output);
    enrich_devices(devices, resolve_, ctx);
    out = std::move(devices);
    return ProbeStatus::Ok;
}

} // namespace netroster::probe
