// ============================================================================
// export.cpp — implementation for export.hpp
// ============================================================================

#include "netroster/export.hpp"
#include "netroster/cidr.hpp"
#include "netroster/device_json.hpp"
#include "netroster/timefmt.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>

namespace netroster {

static std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string truncate(const std::string& s, size_t max) {
    if (s.size() <= max) return s;
    return s.substr(0, max - 3) + "...";
}

static std::string or_dash(const std::string& s) { return s.empty() ? "-" : s; }

const char* device_status(const Device& d, Timestamp now, const StatusThresholds& th) {
    if (d.is_online(now, th.recent)) return "online";
    if (d.is_online(now, th.online)) return "seen";
    return "offline";
}

void sort_by_address(std::vector<Device>& devices) {
    std::stable_sort(devices.begin(), devices.end(), [](const Device& a, const Device& b) {
        uint64_t ka = ipv4_sort_key(a.ip), kb = ipv4_sort_key(b.ip);
        if (ka != kb) return ka < kb;
        return a.ip < b.ip;
    });
}

std::vector<Device> filter_devices(const std::vector<Device>& devices,
                                   bool online_only, bool offline_only,
                                   const std::string& group,
                                   Timestamp now, std::chrono::seconds online_threshold) {
    const std::string want = lower(group);
    std::vector<Device> out;
    for (const auto& d : devices) {
        const bool online = d.is_online(now, online_threshold);
        if (online_only && !online) continue;
        if (offline_only && online) continue;
        if (!want.empty() && lower(d.group) != want) continue;
        out.push_back(d);
    }
    return out;
}

void write_table(const std::vector<Device>& devices, Timestamp now,
                 const StatusThresholds& th, std::ostream& out) {
    if (devices.empty()) { out << "No devices found\n"; return; }

    const std::vector<std::string> header = {"IP", "MAC", "HOSTNAME", "VENDOR", "LABEL", "GROUP", "STATUS"};
    std::vector<std::vector<std::string>> rows;
    rows.reserve(devices.size());
    for (const auto& d : devices) {
        rows.push_back({d.ip, or_dash(d.mac), or_dash(truncate(d.hostname, 25)),
                        or_dash(truncate(d.vendor, 20)), or_dash(d.label), or_dash(d.group),
                        device_status(d, now, th)});
    }

    std::vector<size_t> width(header.size());
    for (size_t c = 0; c < header.size(); ++c) width[c] = header[c].size();
    for (const auto& r : rows)
        for (size_t c = 0; c < r.size(); ++c) width[c] = std::max(width[c], r[c].size());

    auto emit = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < cells.size(); ++c) {
            if (c + 1 == cells.size()) out << cells[c];
            else out << std::left << std::setw(static_cast<int>(width[c] + 2)) << cells[c];
        }
        out << '\n';
    };
    emit(header);
    for (const auto& r : rows) emit(r);
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;
    std::string q = "\"";
    for (char c : value) {
        if (c == '"') q += '"';
        q += c;
    }
    q += '"';
    return q;
}

void write_csv(const std::vector<Device>& devices, std::ostream& out) {
    out << "IP,MAC,Hostname,Vendor,Label,Notes,Group,First Seen,Last Seen\n";
    for (const auto& d : devices) {
        out << csv_field(d.ip) << ',' << csv_field(d.mac) << ',' << csv_field(d.hostname) << ','
            << csv_field(d.vendor) << ',' << csv_field(d.label) << ',' << csv_field(d.notes) << ','
            << csv_field(d.group) << ',' << format_short(d.first_seen) << ','
            << format_short(d.last_seen) << '\n';
    }
}

void write_json(const std::vector<Device>& devices, std::ostream& out) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : devices) arr.push_back(device_to_json(d));
    out << arr.dump(2) << '\n';
}

} // namespace netroster
