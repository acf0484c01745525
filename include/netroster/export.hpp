#pragma once
/**
 * @file export.hpp
 * @brief Device listings for humans and tools: aligned table, CSV, JSON.
 *
 * These take an already filtered and sorted vector; the CLI composes
 * filter_devices() -> sort_by_address() -> write_*().
 */

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

#include "netroster/device.hpp"

namespace netroster {

struct StatusThresholds {
    std::chrono::seconds online{3600};
    std::chrono::seconds recent{300};
};

/** "online" (recent), "seen" (online but not recent) or "offline". */
const char* device_status(const Device& d, Timestamp now, const StatusThresholds& th);

/** Numeric IPv4 order; unparsable addresses sort last, among themselves by text. */
void sort_by_address(std::vector<Device>& devices);

/**
 * @brief Keep devices matching every given criterion.
 * @param group empty = any; otherwise case-insensitive exact match
 */
std::vector<Device> filter_devices(const std::vector<Device>& devices,
                                   bool online_only, bool offline_only,
                                   const std::string& group,
                                   Timestamp now, std::chrono::seconds online_threshold);

void write_table(const std::vector<Device>& devices, Timestamp now,
                 const StatusThresholds& th, std::ostream& out);

void write_csv(const std::vector<Device>& devices, std::ostream& out);

/** Pretty-printed array of persisted-shape device objects. */
void write_json(const std::vector<Device>& devices, std::ostream& out);

/** @brief One CSV field with RFC 4180 quoting applied where needed. */
std::string csv_field(const std::string& value);

} // namespace netroster
