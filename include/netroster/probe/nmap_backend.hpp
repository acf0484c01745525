#pragma once
/**
 * @file nmap_backend.hpp
 * @brief Primary backend: `nmap -sn -oX - <range>` (ping scan, XML on stdout).
 *
 * @details
 * WHAT IT READS
 * -------------
 * From each <host> element of the XML report:
 *   - status@state              -> only "up" hosts are kept
 *   - address[@addrtype=ipv4]   -> Device::ip (hosts without one are dropped)
 *   - address[@addrtype=mac]    -> Device::mac, plus @vendor if nmap knows it
 *   - hostnames/hostname@name   -> first non-empty name
 *   - times@srtt                -> round trip in microseconds, stored as ms
 *
 * FAILURE MODES
 * -------------
 *   - nmap not found on PATH          -> Unavailable
 *   - non-zero exit                   -> Failed ("nmap failed: exit N: <stderr>")
 *   - output that is not an nmap XML  -> Failed ("failed to parse nmap output: ...")
 *   - context expired                 -> Failed ("nmap timed out" / "nmap cancelled")
 *
 * The parser is exposed on its own so it can be tested without nmap installed.
 */

#include <string>
#include <vector>

#include "netroster/config.hpp"
#include "netroster/probe/enrich.hpp"
#include "netroster/probe/probe_backend.hpp"

namespace netroster::probe {

/**
 * @brief Parse an nmap XML report into devices (no enrichment).
 * @return false with @p err set if the document is not valid nmap XML.
 */
bool parse_nmap_xml(const std::string& xml, std::vector<Device>& out, std::string& err);

class NmapBackend : public IProbeBackend {
public:
    /** @param resolve reverse resolver for hosts nmap could not name; null disables it. */
    NmapBackend(const Config& cfg, ReverseResolver resolve);

    const char* name() const override { return "nmap"; }
    ProbeStatus probe(const std::string& range,
                      const ScanContext& ctx,
                      std::vector<Device>& out,
                      std::string& err) override;

private:
    std::string executable_;
    ReverseResolver resolve_;
};

} // namespace netroster::probe
