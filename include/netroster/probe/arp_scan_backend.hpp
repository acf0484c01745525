#pragma once
/**
 * @file arp_scan_backend.hpp
 * @brief Fallback backend: `arp-scan --localnet -q [-I <iface>]`.
 *
 * arp-scan only sees the local link, so the target range is used to pick the
 * interface (the one whose subnet contains the range) rather than passed as a
 * target. Output is one host per line:
 *
 *   192.168.1.2<TAB>00:11:22:33:44:55<TAB>Acme
 *
 * Banner lines ("Interface: ...", "Starting ...", "Ending ...") and anything
 * that does not start with a valid IPv4 address are skipped. Hosts answering
 * more than once (arp-scan's DUP replies) are reported once.
 */

#include <string>
#include <vector>

#include "netroster/config.hpp"
#include "netroster/probe/enrich.hpp"
#include "netroster/probe/probe_backend.hpp"

namespace netroster::probe {

/** @brief Parse arp-scan stdout (no enrichment). Never fails; bad lines are dropped. */
std::vector<Device> parse_arp_scan_output(const std::string& text);

class ArpScanBackend : public IProbeBackend {
public:
    ArpScanBackend(const Config& cfg, ReverseResolver resolve);

    const char* name() const override { return "arp-scan"; }
    ProbeStatus probe(const std::string& range,
                      const ScanContext& ctx,
                      std::vector<Device>& out,
                      std::string& err) override;

private:
    std::string executable_;
    ReverseResolver resolve_;
};

} // namespace netroster::probe
