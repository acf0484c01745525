// ============================================================================
// config.cpp — implementation for config.hpp
// ============================================================================

#include "netroster/config.hpp"

#include <cstdlib>       // getenv for XDG/HOME lookups
#include <fstream>
#include <unistd.h>      // getuid

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace netroster {

static fs::path home_dir() {
    const char* h = std::getenv("HOME");
    return (h && *h) ? fs::path(h) : fs::path();
}

fs::path default_data_dir() {
    if (getuid() == 0) return "/var/lib/netroster";
    if (const char* x = std::getenv("XDG_DATA_HOME"); x && *x)
        return fs::path(x) / "netroster";
    fs::path home = home_dir();
    if (home.empty()) return "/tmp/netroster";
    return home / ".local" / "share" / "netroster";
}

fs::path default_config_file() {
    if (getuid() == 0) return "/etc/netroster/config.json";
    if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
        return fs::path(x) / "netroster" / "config.json";
    fs::path home = home_dir();
    if (home.empty()) return "/tmp/netroster/config.json";
    return home / ".config" / "netroster" / "config.json";
}

Config default_config() {
    Config cfg;
    cfg.data_dir = default_data_dir();
    return cfg;
}

// ---------- per-field overlay helpers ----------
// Each returns false only on a type error; an absent key is a no-op.

static bool take_string(const json& sec, const char* section, const char* key,
                        std::string& out, std::string& err) {
    auto it = sec.find(key);
    if (it == sec.end()) return true;
    if (!it->is_string()) { err = std::string("config: ") + section + "." + key + " must be a string"; return false; }
    out = it->get<std::string>();
    return true;
}

template <class Duration>
static bool take_duration(const json& sec, const char* section, const char* key,
                          Duration& out, std::string& err) {
    auto it = sec.find(key);
    if (it == sec.end()) return true;
    if (!it->is_number_integer() || it->get<long long>() <= 0) {
        err = std::string("config: ") + section + "." + key + " must be a positive integer";
        return false;
    }
    out = Duration(it->get<long long>());
    return true;
}

// Fetch a section object; absent is fine, present-but-not-object is an error.
static const json* section_of(const json& doc, const char* name, std::string& err, bool& ok) {
    ok = true;
    auto it = doc.find(name);
    if (it == doc.end()) return nullptr;
    if (!it->is_object()) { err = std::string("config: ") + name + " must be an object"; ok = false; return nullptr; }
    return &*it;
}

bool apply_config_json(const json& doc, Config& cfg, std::string& err) {
    if (!doc.is_object()) { err = "config: root must be a JSON object"; return false; }

    bool ok = true;
    if (const json* s = section_of(doc, "scanning", err, ok)) {
        if (!take_duration(*s, "scanning", "min_scan_interval", cfg.min_scan_interval, err)) return false;
        if (!take_duration(*s, "scanning", "scan_interval",     cfg.scan_interval,     err)) return false;
        if (!take_duration(*s, "scanning", "scan_timeout",      cfg.scan_timeout,      err)) return false;
        if (!take_duration(*s, "scanning", "dns_timeout_ms",    cfg.dns_timeout,       err)) return false;
        if (!take_string  (*s, "scanning", "nmap_path",         cfg.nmap_path,         err)) return false;
        if (!take_string  (*s, "scanning", "arp_scan_path",     cfg.arp_scan_path,     err)) return false;
    }
    if (!ok) return false;

    if (const json* s = section_of(doc, "storage", err, ok)) {
        std::string dir;
        if (!take_string(*s, "storage", "data_dir", dir, err)) return false;
        if (!dir.empty()) cfg.data_dir = dir;
        if (!take_duration(*s, "storage", "online_threshold", cfg.online_threshold, err)) return false;
        if (!take_duration(*s, "storage", "recent_threshold", cfg.recent_threshold, err)) return false;
    }
    if (!ok) return false;

    if (const json* s = section_of(doc, "logging", err, ok)) {
        if (!take_string(*s, "logging", "level", cfg.log_level, err)) return false;
    }
    return ok;
}

bool load_config(const fs::path& path, Config& cfg, std::string& err) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;          // defaults stand

    std::ifstream in(path);
    if (!in) { err = "config: cannot open " + path.string(); return false; }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        err = "config: " + path.string() + ": " + e.what();
        return false;
    }
    return apply_config_json(doc, cfg, err);
}

json config_to_json(const Config& cfg) {
    json j;
    j["scanning"] = {
        {"min_scan_interval", cfg.min_scan_interval.count()},
        {"scan_interval",     cfg.scan_interval.count()},
        {"scan_timeout",      cfg.scan_timeout.count()},
        {"dns_timeout_ms",    cfg.dns_timeout.count()},
        {"nmap_path",         cfg.nmap_path},
        {"arp_scan_path",     cfg.arp_scan_path},
    };
    j["storage"] = {
        {"data_dir",          cfg.data_dir.string()},
        {"online_threshold",  cfg.online_threshold.count()},
        {"recent_threshold",  cfg.recent_threshold.count()},
    };
    j["logging"] = {{"level", cfg.log_level}};
    return j;
}

} // namespace netroster
