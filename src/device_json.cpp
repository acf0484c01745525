// ============================================================================
// device_json.cpp — implementation for device_json.hpp
// ============================================================================

#include "netroster/device_json.hpp"
#include "netroster/log.hpp"
#include "netroster/timefmt.hpp"

using json = nlohmann::json;

namespace netroster {

// -------- helpers --------

static bool take_str(const json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) { err = std::string(key) + " must be a string"; return false; }
    out = it->get<std::string>();
    return true;
}

static bool take_time(const json& j, const char* key, Timestamp& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string() || !parse_rfc3339(it->get<std::string>(), out)) {
        err = std::string(key) + " is not an RFC 3339 timestamp";
        return false;
    }
    return true;
}

// -------- device --------

json device_to_json(const Device& d) {
    json j = {
        {"ip",         d.ip},
        {"mac",        d.mac},
        {"hostname",   d.hostname},
        {"vendor",     d.vendor},
        {"label",      d.label},
        {"notes",      d.notes},
        {"group",      d.group},
        {"first_seen", format_rfc3339(d.first_seen)},
        {"last_seen",  format_rfc3339(d.last_seen)},
    };
    if (d.response_time_ms) j["response_time"] = *d.response_time_ms;
    return j;
}

bool device_from_json(const json& j, Device& out, std::string& err) {
    if (!j.is_object()) { err = "device record must be an object"; return false; }
    Device d;
    if (!take_str(j, "ip", d.ip, err) || !take_str(j, "mac", d.mac, err) ||
        !take_str(j, "hostname", d.hostname, err) || !take_str(j, "vendor", d.vendor, err) ||
        !take_str(j, "label", d.label, err) || !take_str(j, "notes", d.notes, err) ||
        !take_str(j, "group", d.group, err))
        return false;
    if (!take_time(j, "first_seen", d.first_seen, err) || !take_time(j, "last_seen", d.last_seen, err))
        return false;

    auto rt = j.find("response_time");
    if (rt != j.end() && !rt->is_null()) {
        if (!rt->is_number()) { err = "response_time must be a number"; return false; }
        d.response_time_ms = rt->get<double>();
    }
    out = std::move(d);
    return true;
}

json devices_to_json(const DeviceMap& devices) {
    json j = json::object();
    for (const auto& [ip, d] : devices) j[ip] = device_to_json(d);
    return j;
}

bool devices_from_json(const json& j, DeviceMap& out, std::string& err) {
    if (!j.is_object()) { err = "devices file root must be an object"; return false; }
    DeviceMap devices;
    for (auto it = j.begin(); it != j.end(); ++it) {
        Device d;
        std::string rerr;
        if (!device_from_json(it.value(), d, rerr)) {
            logger()->warn("skipping stored device {}: {}", it.key(), rerr);
            continue;
        }
        if (d.ip.empty()) d.ip = it.key();
        devices[d.ip] = std::move(d);
    }
    out = std::move(devices);
    return true;
}

// -------- scan state --------

json scan_state_to_json(const ScanStateMap& state) {
    json last = json::object();
    for (const auto& [range, t] : state) last[range] = format_rfc3339(t);
    return json{{"last_scan", last}};
}

bool scan_state_from_json(const json& j, ScanStateMap& out, std::string& err) {
    if (!j.is_object()) { err = "scan state root must be an object"; return false; }
    ScanStateMap state;
    auto last = j.find("last_scan");
    if (last != j.end() && !last->is_null()) {
        if (!last->is_object()) { err = "last_scan must be an object"; return false; }
        for (auto it = last->begin(); it != last->end(); ++it) {
            Timestamp t{};
            if (!it->is_string() || !parse_rfc3339(it->get<std::string>(), t)) {
                logger()->warn("skipping scan state for {}: bad timestamp", it.key());
                continue;
            }
            state[it.key()] = t;
        }
    }
    out = std::move(state);
    return true;
}

} // namespace netroster
