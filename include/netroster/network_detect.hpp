#pragma once
/**
 * @page nr-network-detect netroster Network Detector
 * @file network_detect.hpp
 * @brief Enumerate local IPv4 subnets and classify the interfaces that carry them.
 *
 * @details
 * PURPOSE
 * -------
 * Before anything can be scanned, the CLI needs to know which subnets this host
 * is actually attached to. This header turns the OS interface list into a list
 * of Network records ("192.168.1.0/24 on eth0, Ethernet").
 *
 * WHAT THIS DOES
 * --------------
 * - Reads interfaces and their IPv4 addresses with getifaddrs(3).
 * - Drops loopback and interfaces that are not up.
 * - Computes the canonical network (address AND mask) for each IPv4 address.
 * - Labels the interface by its name: Ethernet, Wi-Fi, Tailscale VPN, Bridge,
 *   Docker, ... Unknown names are passed through as the label.
 * - Side helpers for the `networks` command: default gateway from
 *   /proc/net/route, DNS servers from /etc/resolv.conf.
 *
 * TESTABILITY
 * -----------
 * The OS call is isolated in enumerate_interfaces(). The conversion to
 * Network records is the pure networks_from_interfaces(), which tests feed
 * with hand-built InterfaceAddress lists.
 *
 * OPERATIONAL NOTES
 * -----------------
 * Output mirrors live state. Two calls may differ (DHCP renewals, VPN up/down);
 * callers must not cache results across scans.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "netroster/cidr.hpp"
#include "netroster/device.hpp"

namespace netroster {

/**
 * @struct InterfaceAddress
 * @brief One (interface, IPv4 address) pair as reported by the OS.
 */
struct InterfaceAddress {
    std::string name;
    bool up{false};
    bool loopback{false};
    uint32_t address{0};   /**< host byte order */
    int prefix_len{0};
};

/**
 * @brief Read every IPv4 interface address from the OS.
 * @return false with @p err set if getifaddrs() fails.
 */
bool enumerate_interfaces(std::vector<InterfaceAddress>& out, std::string& err);

/** @brief Pure conversion: filter, canonicalize and classify. */
std::vector<Network> networks_from_interfaces(const std::vector<InterfaceAddress>& ifaces);

/**
 * @brief enumerate_interfaces() + networks_from_interfaces().
 * @return false with @p err set if interface enumeration is unavailable.
 */
bool detect_networks(std::vector<Network>& out, std::string& err);

/** @brief Role label for an interface name ("Ethernet", "Wi-Fi", ... or the name itself). */
std::string friendly_interface_name(const std::string& ifname);

bool is_mesh_vpn_interface(const std::string& ifname);
bool is_wireless_interface(const std::string& ifname);

/**
 * @brief Up, non-loopback interface whose subnet contains @p range's network address.
 * @return interface name, or empty when nothing matches.
 */
std::string interface_for_range(const Ipv4Net& range, const std::vector<InterfaceAddress>& ifaces);

/**
 * @brief Default IPv4 gateway from a /proc/net/route style table.
 *
 * The text overload parses a given table (tests); the path overload reads it.
 * @return false with @p err set if the file cannot be read. An empty @p out
 *         with a true return means "no default route".
 */
bool parse_default_gateway(const std::string& route_table, std::string& out);
bool default_gateway(std::string& out, std::string& err,
                     const std::string& path = "/proc/net/route");

/** @brief "nameserver" entries that are valid IPv4 addresses, in file order. */
std::vector<std::string> parse_dns_servers(const std::string& resolv_conf);
std::vector<std::string> dns_servers(const std::string& path = "/etc/resolv.conf");

} // namespace netroster
