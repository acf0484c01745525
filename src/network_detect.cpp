// ============================================================================
// network_detect.cpp — implementation for network_detect.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netroster/network_detect.hpp"

#include <cerrno>          // errno access for diagnostics
#include <cstring>         // strerror for human-readable errno
#include <fstream>
#include <sstream>
#include <stdexcept>       // std::stoul failures

#include <arpa/inet.h>     // ntohl
#include <ifaddrs.h>       // getifaddrs(3)
#include <net/if.h>        // IFF_UP, IFF_LOOPBACK
#include <netinet/in.h>    // sockaddr_in

namespace netroster {

// -------- helpers --------

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

static bool read_whole_file(const std::string& path, std::string& out) {
    std::ifstream in(path);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}


// -------- classification --------

/*
 * friendly_interface_name()
 * -------------------------
 * Name-pattern table, first match wins. Order matters: "en0" must be tested
 * before the generic "en" prefix, and "utun4" (Tailscale's usual macOS
 * tunnel) before the generic "utun".
 */
std::string friendly_interface_name(const std::string& n) {
    if (is_mesh_vpn_interface(n))                                   return "Tailscale VPN";
    if (starts_with(n, "wlan") || starts_with(n, "wlp"))            return "Wi-Fi";
    if (starts_with(n, "eth") || starts_with(n, "enp") || starts_with(n, "eno"))
                                                                    return "Ethernet";
    if (n == "en0")                                                 return "Wi-Fi";
    if (starts_with(n, "en"))                                       return "Ethernet";
    if (starts_with(n, "bridge") || starts_with(n, "br"))           return "Bridge";
    if (starts_with(n, "docker"))                                   return "Docker";
    if (starts_with(n, "veth"))                                     return "Virtual Ethernet";
    if (starts_with(n, "virbr"))                                    return "Virtual Bridge";
    if (starts_with(n, "utun"))                                     return "VPN Tunnel";
    if (starts_with(n, "awdl"))                                     return "Apple Wireless Direct";
    if (starts_with(n, "llw"))                                      return "Low Latency WLAN";
    return n;
}

bool is_mesh_vpn_interface(const std::string& n) {
    return starts_with(n, "tailscale") || n == "utun4";
}

bool is_wireless_interface(const std::string& n) {
    return starts_with(n, "wlan") || starts_with(n, "wlp") || n == "en0";
}


// -------- detection --------

bool enumerate_interfaces(std::vector<InterfaceAddress>& out, std::string& err) {
    out.clear();
    ifaddrs* head = nullptr;
    if (::getifaddrs(&head) != 0) {
        err = std::string("failed to get interfaces: ") + std::strerror(errno);
        return false;
    }

    for (ifaddrs* ifa = head; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;   // IPv4 only
        if (!ifa->ifa_netmask) continue;

        const auto* sin  = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        const auto* mask = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask);

        InterfaceAddress a;
        a.name       = ifa->ifa_name ? ifa->ifa_name : "";
        a.up         = (ifa->ifa_flags & IFF_UP) != 0;
        a.loopback   = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        a.address    = ntohl(sin->sin_addr.s_addr);
        a.prefix_len = mask_to_prefix(ntohl(mask->sin_addr.s_addr));
        if (a.prefix_len < 0) continue;                     // non-contiguous mask: not a subnet we can express
        out.push_back(a);
    }

    ::freeifaddrs(head);
    return true;
}

std::vector<Network> networks_from_interfaces(const std::vector<InterfaceAddress>& ifaces) {
    std::vector<Network> result;
    for (const auto& a : ifaces) {
        if (a.loopback || !a.up) continue;

        Ipv4Net net{a.address, a.prefix_len};
        Network n;
        n.cidr           = net.canonical().to_string();
        n.interface_name = a.name;
        n.friendly_name  = friendly_interface_name(a.name);
        n.ip             = format_ipv4(a.address);
        n.is_mesh_vpn    = is_mesh_vpn_interface(a.name);
        n.is_wireless    = is_wireless_interface(a.name);
        result.push_back(n);
    }
    return result;
}

bool detect_networks(std::vector<Network>& out, std::string& err) {
    std::vector<InterfaceAddress> ifaces;
    if (!enumerate_interfaces(ifaces, err)) return false;
    out = networks_from_interfaces(ifaces);
    return true;
}

std::string interface_for_range(const Ipv4Net& range, const std::vector<InterfaceAddress>& ifaces) {
    const uint32_t target = range.canonical().address;
    for (const auto& a : ifaces) {
        if (!a.up || a.loopback) continue;
        if (Ipv4Net{a.address, a.prefix_len}.contains(target)) return a.name;
    }
    return {};
}


// -------- gateway / DNS --------

/*
 * parse_default_gateway()
 * -----------------------
 * /proc/net/route columns: Iface Destination Gateway Flags RefCnt Use Metric Mask ...
 * Addresses are 8 hex digits in network byte order as the kernel stores them,
 * so on the little-endian hosts we run on the first octet is the low byte.
 * The default route is Destination == Mask == 0 with RTF_UP|RTF_GATEWAY set.
 */
bool parse_default_gateway(const std::string& table, std::string& out) {
    static constexpr unsigned long RTF_UP_FLAG = 0x1, RTF_GATEWAY_FLAG = 0x2;
    out.clear();

    std::istringstream in(table);
    std::string line;
    std::getline(in, line);                                  // header
    while (std::getline(in, line)) {
        std::istringstream row(line);
        std::string iface, dest, gw, flags, refcnt, use, metric, mask;
        if (!(row >> iface >> dest >> gw >> flags >> refcnt >> use >> metric >> mask)) continue;

        unsigned long d = 0, g = 0, f = 0, m = 0;
        try {
            d = std::stoul(dest, nullptr, 16);
            g = std::stoul(gw, nullptr, 16);
            f = std::stoul(flags, nullptr, 16);
            m = std::stoul(mask, nullptr, 16);
        } catch (const std::exception&) {
            continue;                                        // malformed row
        }
        if (d != 0 || m != 0) continue;
        if ((f & (RTF_UP_FLAG | RTF_GATEWAY_FLAG)) != (RTF_UP_FLAG | RTF_GATEWAY_FLAG)) continue;

        const uint32_t host = (static_cast<uint32_t>(g & 0xFF) << 24) |
                              (static_cast<uint32_t>((g >> 8) & 0xFF) << 16) |
                              (static_cast<uint32_t>((g >> 16) & 0xFF) << 8) |
                              static_cast<uint32_t>((g >> 24) & 0xFF);
        out = format_ipv4(host);
        return true;
    }
    return true;                                             // no default route is not an error
}

bool default_gateway(std::string& out, std::string& err, const std::string& path) {
    std::string table;
    if (!read_whole_file(path, table)) {
        err = "failed to read " + path;
        return false;
    }
    return parse_default_gateway(table, out);
}

std::vector<std::string> parse_dns_servers(const std::string& text) {
    std::vector<std::string> servers;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream row(line);
        std::string key, value;
        if (!(row >> key >> value)) continue;
        if (key != "nameserver") continue;
        if (parse_ipv4(value)) servers.push_back(value);
    }
    return servers;
}

std::vector<std::string> dns_servers(const std::string& path) {
    std::string text;
    if (!read_whole_file(path, text)) return {};
    return parse_dns_servers(text);
}

} // namespace netroster
