// ============================================================================
// probe/nmap_backend.cpp — implementation for probe/nmap_backend.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netroster/probe/nmap_backend.hpp"
#include "netroster/cidr.hpp"
#include "netroster/log.hpp"
#include "netroster/process.hpp"

#include <cstdlib>         // strtol for srtt

#include <pugixml.hpp>

namespace netroster::probe {

// nmap reports srtt as integer microseconds; anything else means "no latency".
static bool parse_srtt_ms(const char* text, double& out_ms) {
    if (!text || !*text) return false;
    char* end = nullptr;
    long usec = std::strtol(text, &end, 10);
    if (!end || *end || usec < 0) return false;
    out_ms = static_cast<double>(usec) / 1000.0;
    return true;
}

bool parse_nmap_xml(const std::string& xml, std::vector<Device>& out, std::string& err) {
    out.clear();

    pugi::xml_document doc;
    pugi::xml_parse_result res = doc.load_buffer(xml.data(), xml.size());
    if (!res) {
        err = std::string("failed to parse nmap output: ") + res.description();
        return false;
    }
    pugi::xml_node root = doc.child("nmaprun");
    if (!root) {
        err = "failed to parse nmap output: missing nmaprun element";
        return false;
    }

    for (pugi::xml_node host : root.children("host")) {
        if (std::string(host.child("status").attribute("state").as_string()) != "up") continue;

        Device d;
        for (pugi::xml_node addr : host.children("address")) {
            const std::string type = addr.attribute("addrtype").as_string();
            if (type == "ipv4") {
                d.ip = addr.attribute("addr").as_string();
            } else if (type == "mac") {
                d.mac = addr.attribute("addr").as_string();
                const char* vendor = addr.attribute("vendor").as_string();
                if (*vendor) d.vendor = vendor;
            }
        }
        if (d.ip.empty() || !parse_ipv4(d.ip)) continue;   // IPv6-only or garbage

        for (pugi::xml_node hn : host.child("hostnames").children("hostname")) {
            const char* name = hn.attribute("name").as_string();
            if (*name) { d.hostname = name; break; }
        }

        double ms = 0.0;
        if (parse_srtt_ms(host.child("times").attribute("srtt").as_string(), ms))
            d.response_time_ms = ms;

        out.push_back(std::move(d));
    }
    return true;
}

NmapBackend::NmapBackend(const Config& cfg, ReverseResolver resolve)
: executable_(cfg.nmap_path), resolve_(std::move(resolve)) {}

ProbeStatus NmapBackend::probe(const std::string& range,
                               const ScanContext& ctx,
                               std::vector<Device>& out,
                               std::string& err) {
    out.clear();
    const std::string exe = find_executable(executable_);
    if (exe.empty()) {
        err = "nmap not found";
        return ProbeStatus::Unavailable;
    }

    ProcessResult pr;
    std::string perr;
    logger()->debug("running {} -sn -oX - {}", exe, range);
    if (!run_process({exe, "-sn", "-oX", "-", range}, ctx, pr, perr)) {
        err = "nmap " + perr;
        return ProbeStatus::Failed;
    }
    if (pr.exit_code != 0) {
        err = "nmap failed: exit " + std::to_string(pr.exit_code);
        if (!pr.err_output.empty()) err += ": " + pr.err_output.substr(0, pr.err_output.find('\n'));
        return ProbeStatus::Failed;
    }

    std::vector<Device> devices;
    if (!parse_nmap_xml(pr.output, devices, err)) return ProbeStatus::Failed;

    enrich_devices(devices, resolve_, ctx);
    out = std::move(devices);
    return ProbeStatus::Ok;
}

} // namespace netroster::probe
