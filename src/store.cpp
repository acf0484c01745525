// ============================================================================
// store.cpp — implementation for store.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "netroster/store.hpp"
#include "netroster/atomic_file.hpp"
#include "netroster/cidr.hpp"
#include "netroster/log.hpp"

#include <mutex>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace netroster {

// -------- reconcile --------

Device reconcile(const Device* existing, const Device& incoming, ReconcileMode mode, Timestamp now) {
    if (mode == ReconcileMode::Observation) {
        if (!existing) {
            Device d = incoming;
            d.label.clear();
            d.notes.clear();
            d.group.clear();
            d.first_seen = now;
            d.last_seen  = now;
            return d;
        }
        Device d = *existing;
        d.mac              = incoming.mac;
        d.hostname         = incoming.hostname;
        d.vendor           = incoming.vendor;
        d.response_time_ms = incoming.response_time_ms;
        if (now > d.last_seen) d.last_seen = now;
        return d;
    }

    // Replace
    Device d = incoming;
    if (!existing) {
        if (!is_set(d.first_seen)) d.first_seen = now;
        if (!is_set(d.last_seen))  d.last_seen  = d.first_seen;
        return d;
    }
    if (d.label.empty()) d.label = existing->label;
    if (d.notes.empty()) d.notes = existing->notes;
    if (d.group.empty()) d.group = existing->group;
    if (!is_set(d.first_seen)) d.first_seen = existing->first_seen;
    if (existing->last_seen > d.last_seen) d.last_seen = existing->last_seen;
    return d;
}

// -------- helpers --------

static bool read_json(const fs::path& p, json& out, std::string& why) {
    std::string text;
    if (!read_file(p, text, why)) return false;
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) { why = p.string() + " is empty"; return false; }
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) { why = p.string() + " is not valid JSON"; return false; }
    out = std::move(j);
    return true;
}

static bool valid_ip(const std::string& ip, std::string& err) {
    if (parse_ipv4(ip)) return true;
    err = "invalid IP address: '" + ip + "'";
    return false;
}

// -------- Store --------

Store::Store(const Config& cfg)
: data_dir_(cfg.data_dir),
  devices_path_(cfg.devices_file()),
  state_path_(cfg.state_file()),
  online_threshold_(cfg.online_threshold) {}

fs::path Store::lock_path() const {
    return data_dir_ / ".netroster.lock";
}

fs::path Store::backup_path() const {
    fs::path p = devices_path_;
    p += ".backup";
    return p;
}

bool Store::open(std::string& err) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        err = "create data directory " + data_dir_.string() + ": " + ec.message();
        return false;
    }
    load_devices_locked();
    load_state_locked();
    logger()->debug("store opened: {} devices, {} ranges", devices_.size(), state_.size());
    return true;
}

void Store::load_devices_locked() {
    devices_.clear();
    std::string why;
    json j;
    if (read_json(devices_path_, j, why) && devices_from_json(j, devices_, why)) return;

    std::error_code ec;
    const bool primary_missing = !fs::exists(devices_path_, ec);
    const fs::path backup = backup_path();
    std::string bwhy;
    if (fs::exists(backup, ec) && read_json(backup, j, bwhy) && devices_from_json(j, devices_, bwhy)) {
        logger()->warn("{}; recovered {} devices from {}", why, devices_.size(), backup.string());
        return;
    }
    if (!primary_missing) logger()->warn("{}; starting with an empty inventory", why);
    devices_.clear();
}

void Store::load_state_locked() {
    state_.clear();
    std::string why;
    json j;
    if (read_json(state_path_, j, why) && scan_state_from_json(j, state_, why)) return;
    std::error_code ec;
    if (fs::exists(state_path_, ec)) logger()->warn("{}; scan state reset", why);
    state_.clear();
}

// Another process may have written since our last read; take the on-disk
// files as the base for the change about to be applied.
bool Store::sync_locked(FileLock& file_lock, std::string& err) {
    if (!file_lock.acquire(lock_path(), err)) {
        logger()->error("store lock failed: {}", err);
        return false;
    }
    load_devices_locked();
    load_state_locked();
    return true;
}

// Only a primary that still parses becomes the backup; a corrupt one would
// replace the copy that load_devices_locked() just recovered from.
void Store::refresh_backup_locked() {
    std::string text, why;
    if (!read_file(devices_path_, text, why)) return;     // first save
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    DeviceMap check;
    if (j.is_discarded() || !devices_from_json(j, check, why)) {
        logger()->warn("{} does not parse; keeping previous backup", devices_path_.string());
        return;
    }
    if (!atomic_write(backup_path(), text, why))
        logger()->warn("backup of {} failed: {}", devices_path_.string(), why);
}

bool Store::save_devices_locked(std::string& err) {
    refresh_backup_locked();
    if (!atomic_write(devices_path_, devices_to_json(devices_).dump(2), err)) {
        logger()->error("saving devices failed: {}", err);
        return false;
    }
    return true;
}

bool Store::save_state_locked(std::string& err) {
    if (!atomic_write(state_path_, scan_state_to_json(state_).dump(2), err)) {
        logger()->error("saving scan state failed: {}", err);
        return false;
    }
    return true;
}

std::vector<Device> Store::get_devices() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<Device> out;
    out.reserve(devices_.size());
    for (const auto& [ip, d] : devices_) out.push_back(d);
    return out;
}

std::optional<Device> Store::get_device(const std::string& ip) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = devices_.find(ip);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

bool Store::update_device(const Device& device, std::string& err, Timestamp now) {
    if (!valid_ip(device.ip, err)) return false;
    std::unique_lock<std::shared_mutex> lock(mu_);
    FileLock file_lock;
    if (!sync_locked(file_lock, err)) return false;
    auto it = devices_.find(device.ip);
    const Device* existing = it == devices_.end() ? nullptr : &it->second;
    devices_[device.ip] = reconcile(existing, device, ReconcileMode::Replace, now);
    return save_devices_locked(err);
}

bool Store::update_device_fields(const std::string& ip,
                                 const std::optional<std::string>& label,
                                 const std::optional<std::string>& notes,
                                 const std::optional<std::string>& group,
                                 std::string& err) {
    if (!valid_ip(ip, err)) return false;
    std::unique_lock<std::shared_mutex> lock(mu_);
    FileLock file_lock;
    if (!sync_locked(file_lock, err)) return false;
    auto it = devices_.find(ip);
    if (it == devices_.end()) { err = DEVICE_NOT_FOUND + ip; return false; }
    if (label) it->second.label = *label;
    if (notes) it->second.notes = *notes;
    if (group) it->second.group = *group;
    return save_devices_locked(err);
}

bool Store::delete_device(const std::string& ip, std::string& err) {
    if (!valid_ip(ip, err)) return false;
    std::unique_lock<std::shared_mutex> lock(mu_);
    FileLock file_lock;
    if (!sync_locked(file_lock, err)) return false;
    if (devices_.erase(ip) == 0) { err = DEVICE_NOT_FOUND + ip; return false; }
    return save_devices_locked(err);
}

bool Store::merge_devices(const std::vector<Device>& discovered, std::string& err, Timestamp now) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    FileLock file_lock;
    if (!sync_locked(file_lock, err)) return false;
    size_t added = 0, updated = 0;
    for (const auto& d : discovered) {
        if (d.ip.empty() || !parse_ipv4(d.ip)) {
            logger()->debug("merge: skipping device with address '{}'", d.ip);
            continue;
        }
        auto it = devices_.find(d.ip);
        if (it == devices_.end()) {
            devices_[d.ip] = reconcile(nullptr, d, ReconcileMode::Observation, now);
            ++added;
        } else {
            it->second = reconcile(&it->second, d, ReconcileMode::Observation, now);
            ++updated;
        }
    }
    logger()->info("merge: {} new, {} updated, {} total", added, updated, devices_.size());
    return save_devices_locked(err);
}

Timestamp Store::get_last_scan(const std::string& range) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = state_.find(range);
    return it == state_.end() ? Timestamp{} : it->second;
}

bool Store::set_last_scan(const std::string& range, Timestamp t, std::string& err) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    FileLock file_lock;
    if (!sync_locked(file_lock, err)) return false;
    state_[range] = t;
    return save_state_locked(err);
}

bool Store::reserve_scan(const std::string& range, std::chrono::seconds min_interval,
                         RateDecision& decision, std::string& err, Timestamp now) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    FileLock file_lock;
    if (!sync_locked(file_lock, err)) return false;
    auto it = state_.find(range);
    decision = check_rate_limit(it == state_.end() ? Timestamp{} : it->second, min_interval, now);
    if (!decision.allowed) return true;
    state_[range] = now;
    return save_state_locked(err);
}

DeviceStats Store::get_stats(Timestamp now) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    DeviceStats s;
    for (const auto& [ip, d] : devices_) {
        ++s.total;
        if (d.is_online(now, online_threshold_)) ++s.online;
        else ++s.offline;
        if (!d.group.empty()) ++s.groups[d.group];
    }
    return s;
}

} // namespace netroster
