/**
 * @file device.hpp
 * @brief Core records of the netroster inventory: Device, Network, ScanResult, DeviceStats.
 *
 * @details
 * PURPOSE
 * -------
 * These are the plain data types every other layer passes around. A Device is
 * one row of the roster (one IPv4 address). A Network is a subnet detected on a
 * local interface. A ScanResult is the short-lived outcome of one probe run,
 * consumed by the Store merge and then thrown away.
 *
 * FIELD OWNERSHIP
 * ---------------
 * Device fields fall into two camps:
 *   - liveness fields (mac, hostname, vendor, response_time_ms, last_seen):
 *     rewritten by every scan that sees the address.
 *   - annotation fields (label, notes, group): written only by explicit user
 *     edits. Scans never touch them.
 * first_seen is set once when the record is created and never changes.
 *
 * TIME
 * ----
 * Timestamps are std::chrono::system_clock time points. A default-constructed
 * Timestamp (the epoch) means "unset"; see is_set().
 */
#ifndef NETROSTER_DEVICE_HPP
#define NETROSTER_DEVICE_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netroster {

using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/** @brief True if @p t carries a real time (anything but the epoch sentinel). */
inline bool is_set(Timestamp t) { return t != Timestamp{}; }

/**
 * @struct Device
 * @brief One inventory entry, keyed by IPv4 address.
 */
struct Device {
    std::string ip;                          /**< Primary key, dotted quad. Immutable once stored. */
    std::string mac;                         /**< Hardware address as reported by the backend. */
    std::string hostname;                    /**< Discovered or reverse-resolved name. */
    std::string vendor;                      /**< Backend vendor string or OUI table lookup. */
    std::string label;                       /**< User annotation. */
    std::string notes;                       /**< User annotation. */
    std::string group;                       /**< User annotation, used for stats bucketing. */
    Timestamp   first_seen{};                /**< Set on creation only. */
    Timestamp   last_seen{};                 /**< Moves forward only. */
    std::optional<double> response_time_ms;  /**< Last measured round trip, if the backend reported one. */

    /** Seen within @p threshold of @p now. */
    bool is_online(Timestamp now, std::chrono::seconds threshold) const {
        return is_set(last_seen) && now - last_seen < threshold;
    }
};

bool operator==(const Device& a, const Device& b);
inline bool operator!=(const Device& a, const Device& b) { return !(a == b); }

/// address -> record; std::map keeps file output stable between writes
using DeviceMap = std::map<std::string, Device>;

/**
 * @struct Network
 * @brief A subnet detected on a live local interface. Never persisted.
 */
struct Network {
    std::string cidr;            /**< Canonical "a.b.c.d/len" with host bits zeroed. */
    std::string interface_name;  /**< OS interface name, e.g. "eth0". */
    std::string friendly_name;   /**< Role label, e.g. "Ethernet", or the raw name. */
    std::string ip;              /**< The interface's own address on this subnet. */
    bool is_mesh_vpn{false};
    bool is_wireless{false};
};

/**
 * @struct ScanResult
 * @brief Outcome of one Scanner::scan() call.
 *
 * success and error are mutually exclusive: a failed result carries a non-empty
 * error and no devices; a successful one carries an empty error.
 */
struct ScanResult {
    bool success{false};
    std::string error;
    std::vector<Device> devices;
    std::size_t device_count{0};
    std::string network;         /**< Target range string exactly as given. */
    std::string scanner;         /**< Name of the backend that produced the devices. */
    double duration_s{0.0};
    Timestamp timestamp{};       /**< Completion time. */
};

/**
 * @struct DeviceStats
 * @brief On-demand inventory counters (see Store::get_stats()).
 */
struct DeviceStats {
    std::size_t total{0};
    std::size_t online{0};
    std::size_t offline{0};
    std::map<std::string, std::size_t> groups;
};

} // namespace netroster

#endif
