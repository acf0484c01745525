#pragma once
/**
 * @page nr-store netroster Device Store
 * @file store.hpp
 * @brief Thread-safe device inventory and scan-state map, persisted as JSON.
 *
 * @details
 * PURPOSE
 * -------
 * The Store is the single owner of the device map (address -> Device) and the
 * scan-state map (range -> last scan time). Every read and write goes through
 * its public operations; nothing else touches devices.json or scan_state.json.
 *
 * LOCKING
 * -------
 * One std::shared_mutex. Readers take it shared. Every mutation takes it
 * exclusively for the full read-modify-write-persist cycle, so a reader never
 * sees a change that is not also on its way to disk.
 *
 * Other processes (a second CLI invocation, a long scan) share the files, so
 * inside the mutex each mutation also holds an flock on <data_dir>/.netroster.lock,
 * reloads both files from disk, applies its change and persists before
 * releasing it. Reads serve the snapshot from the last open() or mutation.
 *
 * PERSISTENCE
 * -----------
 * Each mutation rewrites the whole backing file with atomic_write(). Before the
 * devices file is replaced, the current on-disk copy is saved as
 * devices.json.backup, but only if it parses. If the write fails the operation
 * returns false and the change is lost at the next reload.
 *
 * RECOVERY
 * --------
 * open() loads devices.json; if it is missing, empty or unparsable it tries
 * devices.json.backup, and failing that starts empty. Corrupt state never
 * makes open() fail. Only an unusable data directory does.
 *
 * FIELD RULES
 * -----------
 * See reconcile(). In short: scans refresh liveness fields, users own
 * label/notes/group, first_seen never changes, last_seen never goes back.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "netroster/atomic_file.hpp"
#include "netroster/config.hpp"
#include "netroster/device.hpp"
#include "netroster/device_json.hpp"
#include "netroster/rate_limit.hpp"

namespace netroster {

/// Prefix of the error reported for an unknown address.
inline constexpr const char* DEVICE_NOT_FOUND = "device not found: ";

enum class ReconcileMode : uint8_t {
    Observation = 0,   ///< scan sighting: refresh liveness, keep annotations
    Replace     = 1    ///< whole-record write: blanks backfilled from existing
};

/**
 * @brief Compute the record to store for @p incoming given the current one.
 *
 * Observation, existing: mac/hostname/vendor/response_time from @p incoming,
 *   last_seen = max(existing, now); ip, first_seen and annotations kept.
 * Observation, new: first_seen = last_seen = now, annotations cleared.
 * Replace, existing: blank label/notes/group and unset first_seen taken from
 *   existing; last_seen = max(existing, incoming).
 * Replace, new: unset first_seen -> now; unset last_seen -> first_seen.
 *
 * @param existing current record or nullptr
 */
Device reconcile(const Device* existing, const Device& incoming, ReconcileMode mode, Timestamp now);

class Store {
public:
    explicit Store(const Config& cfg);

    /** Create the data directory, then load both files (with fallback). */
    bool open(std::string& err);

    // -------- devices --------
    std::vector<Device> get_devices() const;
    std::optional<Device> get_device(const std::string& ip) const;

    /** Whole-record upsert, reconcile() in Replace mode. */
    bool update_device(const Device& device, std::string& err, Timestamp now = Clock::now());

    /** Set only the given annotations. Fails with DEVICE_NOT_FOUND for unknown addresses. */
    bool update_device_fields(const std::string& ip,
                              const std::optional<std::string>& label,
                              const std::optional<std::string>& notes,
                              const std::optional<std::string>& group,
                              std::string& err);

    bool delete_device(const std::string& ip, std::string& err);

    /**
     * @brief Fold one scan's devices into the inventory (Observation mode).
     *
     * Entries with an empty or invalid address are skipped. Duplicates in one
     * batch are applied in order. Devices never seen are never removed.
     */
    bool merge_devices(const std::vector<Device>& discovered, std::string& err, Timestamp now = Clock::now());

    // -------- scan state --------
    /** Unset Timestamp if the range was never scanned. */
    Timestamp get_last_scan(const std::string& range) const;
    bool set_last_scan(const std::string& range, Timestamp t, std::string& err);

    /**
     * @brief Atomic rate-limit check-and-set for @p range.
     *
     * Under the exclusive lock and the file lock: check the last scan time against @p min_interval
     * and, if allowed, record @p now as the new last scan time. @p decision
     * carries the outcome either way.
     *
     * @return false only if recording the reservation failed to persist.
     */
    bool reserve_scan(const std::string& range, std::chrono::seconds min_interval,
                      RateDecision& decision, std::string& err, Timestamp now = Clock::now());

    DeviceStats get_stats(Timestamp now = Clock::now()) const;

    const std::filesystem::path& devices_path() const { return devices_path_; }
    const std::filesystem::path& state_path() const { return state_path_; }
    std::filesystem::path backup_path() const;
    std::filesystem::path lock_path() const;

private:
    bool sync_locked(FileLock& file_lock, std::string& err);
    void refresh_backup_locked();
    void load_devices_locked();
    void load_state_locked();
    bool save_devices_locked(std::string& err);
    bool save_state_locked(std::string& err);

    std::filesystem::path data_dir_;
    std::filesystem::path devices_path_;
    std::filesystem::path state_path_;
    std::chrono::seconds online_threshold_;

    mutable std::shared_mutex mu_;
    DeviceMap devices_;
    ScanStateMap state_;
};

} // namespace netroster
