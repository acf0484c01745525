#pragma once
/**
 * @file config.hpp
 * @brief Typed runtime configuration for the engine and CLI.
 *
 * @details
 * PURPOSE
 * -------
 * One Config value is built at startup (defaults -> config file -> CLI flags)
 * and handed by reference to Store, Scanner and the probe backends. Nothing
 * reads configuration from globals.
 *
 * FILE FORMAT
 * -----------
 * JSON, every key optional; a key that is present overrides its default:
 * @code
 *   {
 *     "scanning": { "min_scan_interval": 30, "scan_interval": 300,
 *                   "scan_timeout": 300, "dns_timeout_ms": 2000,
 *                   "nmap_path": "nmap", "arp_scan_path": "arp-scan" },
 *     "storage":  { "data_dir": "/var/lib/netroster",
 *                   "online_threshold": 3600, "recent_threshold": 300 },
 *     "logging":  { "level": "warn" }
 *   }
 * @endcode
 * Durations are whole seconds unless the key says otherwise. Unknown keys are
 * ignored so newer files still load in older builds.
 *
 * DEFAULT LOCATIONS
 * -----------------
 * root:   /etc/netroster/config.json,  data in /var/lib/netroster
 * users:  $XDG_CONFIG_HOME/netroster/config.json (or ~/.config/...),
 *         data in $XDG_DATA_HOME/netroster (or ~/.local/share/...)
 */

#include <chrono>
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"

namespace netroster {

struct Config {
    // scanning
    std::chrono::seconds      min_scan_interval{30};
    std::chrono::seconds      scan_interval{300};
    std::chrono::seconds      scan_timeout{300};
    std::chrono::milliseconds dns_timeout{2000};
    std::string               nmap_path{"nmap"};
    std::string               arp_scan_path{"arp-scan"};

    // storage
    std::filesystem::path     data_dir;
    std::chrono::seconds      online_threshold{3600};
    std::chrono::seconds      recent_threshold{300};

    // logging
    std::string               log_level{"warn"};

    std::filesystem::path devices_file() const { return data_dir / "devices.json"; }
    std::filesystem::path state_file()   const { return data_dir / "scan_state.json"; }
};

/** @brief Defaults, with data_dir resolved for the current user. */
Config default_config();

std::filesystem::path default_data_dir();
std::filesystem::path default_config_file();

/**
 * @brief Overlay a JSON config file onto @p cfg, field by field.
 *
 * A missing file leaves @p cfg as is and succeeds. Unparsable JSON, a
 * non-object root, a key with the wrong type or a non-positive duration fails
 * with a reason in @p err; @p cfg may be partially updated in that case.
 */
bool load_config(const std::filesystem::path& path, Config& cfg, std::string& err);

/** @brief Same overlay from an already parsed document. */
bool apply_config_json(const nlohmann::json& doc, Config& cfg, std::string& err);

/** @brief Effective configuration in the file format above. */
nlohmann::json config_to_json(const Config& cfg);

} // namespace netroster
