#pragma once
/**
 * @file device_json.hpp
 * @brief nlohmann::json codecs for Device and the scan-state map.
 *
 * Shape of one persisted device (also used by `list --format json` and
 * `export`):
 * @code
 *   { "ip": "192.168.1.2", "mac": "00:11:22:33:44:55", "hostname": "nas",
 *     "vendor": "Synology", "label": "", "notes": "", "group": "",
 *     "first_seen": "2026-10-18T09:24:00Z", "last_seen": "2026-10-18T10:00:00.5Z",
 *     "response_time": 0.42 }
 * @endcode
 * response_time is omitted when no latency was measured. Missing string keys
 * decode as empty, missing timestamps as unset.
 */

#include <map>
#include <string>

#include "nlohmann/json.hpp"

#include "netroster/device.hpp"

namespace netroster {

using ScanStateMap = std::map<std::string, Timestamp>;

nlohmann::json device_to_json(const Device& d);

/** @return false with @p err set on a wrong-typed key or a bad timestamp. */
bool device_from_json(const nlohmann::json& j, Device& out, std::string& err);

/** address -> device object */
nlohmann::json devices_to_json(const DeviceMap& devices);

/**
 * @brief Decode a whole devices file.
 *
 * A non-object root fails. Individual records that fail to decode are
 * skipped (logged); a record with no "ip" takes its map key.
 */
bool devices_from_json(const nlohmann::json& j, DeviceMap& out, std::string& err);

/** {"last_scan": {range: time}} */
nlohmann::json scan_state_to_json(const ScanStateMap& state);
bool scan_state_from_json(const nlohmann::json& j, ScanStateMap& out, std::string& err);

} // namespace netroster
