/**
 * @file main.cpp
 * @brief netroster CLI: one-shot front end over netroster::Store and netroster::Scanner.
 *
 * Responsibilities:
 *  - Parse global options and one subcommand (CLI11).
 *  - Build the effective Config: defaults -> config file -> CLI flags.
 *  - Open the Store, run the command, print results on stdout.
 *  - Report failures on stderr as "status=error reason=<token> ..." lines.
 *
 * Exit codes:
 *  0 ok, 1 runtime failure (scan or persistence), 2 usage/validation,
 *  3 every requested range was rate limited, 4 device not found.
 *
 * Notes:
 *  - Each invocation is its own process; concurrent runs coordinate only
 *    through the files in the data directory.
 *  - `scan` reserves the range (rate limit check-and-set) before spawning
 *    anything, unless --force is given.
 */

#include <cstdlib>
#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "netroster/atomic_file.hpp"
#include "netroster/cidr.hpp"
#include "netroster/config.hpp"
#include "netroster/export.hpp"
#include "netroster/log.hpp"
#include "netroster/network_detect.hpp"
#include "netroster/process.hpp"
#include "netroster/scanner.hpp"
#include "netroster/store.hpp"

#ifndef NETROSTER_VERSION
#define NETROSTER_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;
using namespace netroster;

enum ExitCode : int {
    EXIT_OK           = 0,
    EXIT_RUNTIME      = 1,
    EXIT_USAGE        = 2,
    EXIT_RATE_LIMITED = 3,
    EXIT_NOT_FOUND    = 4
};

// ---------- small utilities ----------

static int fail(const std::string& reason, const std::string& detail = {}, int code = EXIT_RUNTIME) {
    std::cerr << "status=error reason=" << reason;
    if (!detail.empty()) std::cerr << " detail=\"" << detail << "\"";
    std::cerr << "\n";
    return code;
}

// Map a Store edit/delete error to an exit code.
static int store_fail(const std::string& ip, const std::string& err) {
    if (err.rfind(DEVICE_NOT_FOUND, 0) == 0)
        return fail("device_not_found ip=" + ip, {}, EXIT_NOT_FOUND);
    return fail("persist_failed", err);
}

static StatusThresholds thresholds_of(const Config& cfg) {
    StatusThresholds th;
    th.online = cfg.online_threshold;
    th.recent = cfg.recent_threshold;
    return th;
}

// No argument: first non-mesh network, else the first one. "all": every network.
static bool resolve_ranges(const std::string& arg, std::vector<std::string>& ranges, std::string& err) {
    if (!arg.empty() && arg != "all") {
        ranges.push_back(arg);
        return true;
    }
    std::vector<Network> nets;
    if (!detect_networks(nets, err)) return false;
    if (nets.empty()) { err = "no active IPv4 networks detected"; return false; }

    if (arg == "all") {
        for (const auto& n : nets) ranges.push_back(n.cidr);
        return true;
    }
    for (const auto& n : nets) {
        if (!n.is_mesh_vpn) { ranges.push_back(n.cidr); return true; }
    }
    ranges.push_back(nets.front().cidr);
    return true;
}

static void print_networks(const std::vector<Network>& nets) {
    if (nets.empty()) { std::cout << "No networks detected\n"; return; }
    std::cout << std::left << std::setw(20) << "NETWORK" << std::setw(14) << "INTERFACE"
              << std::setw(18) << "TYPE" << std::setw(17) << "ADDRESS" << "FLAGS\n";
    for (const auto& n : nets) {
        std::string flags;
        if (n.is_mesh_vpn) flags += "mesh-vpn ";
        if (n.is_wireless) flags += "wireless ";
        if (flags.empty()) flags = "-";
        std::cout << std::left << std::setw(20) << n.cidr << std::setw(14) << n.interface_name
                  << std::setw(18) << n.friendly_name << std::setw(17) << n.ip << flags << "\n";
    }
}

// ---------- commands ----------

static int cmd_scan(const Config& cfg, Store& store, const std::string& arg, bool force) {
    if (!arg.empty() && arg != "all" && !parse_cidr(arg))
        return fail("invalid_range", arg + " (expected a.b.c.d/len)", EXIT_USAGE);

    std::vector<std::string> ranges;
    std::string err;
    if (!resolve_ranges(arg, ranges, err)) return fail("no_networks", err);

    Scanner scanner(cfg, Scanner::default_backends(cfg));
    size_t limited = 0, failures = 0;

    for (const auto& range : ranges) {
        if (!force) {
            RateDecision d;
            if (!store.reserve_scan(range, cfg.min_scan_interval, d, err)) {
                failures++;
                fail("persist_failed", err);
                continue;
            }
            if (!d.allowed) {
                std::cout << "Rate limited for " << range << ", wait " << wait_seconds(d) << " seconds\n";
                limited++;
                continue;
            }
        }

        ScanContext ctx(std::chrono::duration_cast<std::chrono::milliseconds>(cfg.scan_timeout));
        ScanResult r = scanner.scan(range, ctx);
        if (!r.success) {
            failures++;
            fail("scan_failed network=" + range, r.error);
            continue;
        }
        if (!store.merge_devices(r.devices, err)) {
            failures++;
            fail("persist_failed", err);
            continue;
        }
        if (force && !store.set_last_scan(range, r.timestamp, err)) {
            failures++;
            fail("persist_failed", err);
            continue;
        }
        std::cout << "Found " << r.device_count << " devices using " << r.scanner << " ("
                  << std::fixed << std::setprecision(2) << r.duration_s << "s)\n";
    }

    if (failures) return EXIT_RUNTIME;
    if (limited == ranges.size()) return EXIT_RATE_LIMITED;
    return EXIT_OK;
}

static int cmd_list(const Config& cfg, const Store& store, bool online, bool offline,
                    const std::string& group, const std::string& format) {
    const Timestamp now = Clock::now();
    auto devices = filter_devices(store.get_devices(), online, offline, group, now, cfg.online_threshold);
    sort_by_address(devices);

    if (format == "csv")       write_csv(devices, std::cout);
    else if (format == "json") write_json(devices, std::cout);
    else                       write_table(devices, now, thresholds_of(cfg), std::cout);
    return EXIT_OK;
}

static int cmd_networks() {
    std::vector<Network> nets;
    std::string err;
    if (!detect_networks(nets, err)) return fail("detect_failed", err);
    print_networks(nets);

    std::string gw, gerr;
    if (!default_gateway(gw, gerr)) logger()->debug("default gateway: {}", gerr);
    std::cout << "\nGateway: " << (gw.empty() ? "-" : gw) << "\n";

    auto dns = dns_servers();
    std::cout << "DNS:     ";
    if (dns.empty()) std::cout << "-";
    for (size_t i = 0; i < dns.size(); ++i) std::cout << (i ? ", " : "") << dns[i];
    std::cout << "\n";
    return EXIT_OK;
}

static int cmd_status(const Config& cfg, const Store& store) {
    std::cout << "Scanners:\n";
    for (const auto& tool : {cfg.nmap_path, cfg.arp_scan_path}) {
        std::string path = find_executable(tool);
        std::cout << "  " << std::left << std::setw(10) << tool << (path.empty() ? "not found" : path) << "\n";
    }

    DeviceStats s = store.get_stats();
    std::cout << "\nDevices:\n"
              << "  Total:   " << s.total << "\n"
              << "  Online:  " << s.online << "\n"
              << "  Offline: " << s.offline << "\n";
    if (!s.groups.empty()) {
        std::cout << "  Groups:\n";
        for (const auto& [g, n] : s.groups) std::cout << "    " << g << ": " << n << "\n";
    }
    std::cout << "\nData directory: " << cfg.data_dir.string() << "\n\n";

    std::vector<Network> nets;
    std::string err;
    if (!detect_networks(nets, err)) {
        std::cout << "Networks: unavailable (" << err << ")\n";
        return EXIT_OK;
    }
    print_networks(nets);
    return EXIT_OK;
}

static int cmd_export(const Store& store, const std::string& file) {
    auto devices = store.get_devices();
    sort_by_address(devices);
    std::ostringstream csv;
    write_csv(devices, csv);

    std::string err;
    if (!atomic_write(file, csv.str(), err)) return fail("export_failed", err);
    std::cout << "Exported " << devices.size() << " devices to " << file << "\n";
    return EXIT_OK;
}

// ---------- main ----------

int main(int argc, char** argv) {
    std::string opt_config;
    std::string opt_data_dir;
    bool opt_verbose = false;
    bool opt_quiet   = false;
    int  opt_min_interval = 0;   // 0 => config

    CLI::App app{"netroster: LAN device discovery and inventory"};
    app.require_subcommand(1);
    app.add_option("--config", opt_config, "Config file (JSON)");
    app.add_option("--data-dir", opt_data_dir, "Directory for devices.json and scan_state.json");
    app.add_option("--min-interval", opt_min_interval, "Minimum seconds between scans of one range")
        ->check(CLI::PositiveNumber);
    auto* verbose = app.add_flag("-v,--verbose", opt_verbose, "Debug logging on stderr");
    app.add_flag("-q,--quiet", opt_quiet, "Only log errors")->excludes(verbose);

    // scan
    std::string scan_range;
    bool scan_force = false;
    int  scan_timeout = 0;       // 0 => config
    auto* scan = app.add_subcommand("scan", "Discover devices and merge them into the inventory");
    scan->add_option("range", scan_range, "CIDR range, or 'all' (default: primary network)");
    scan->add_flag("--force", scan_force, "Ignore the rate limit");
    scan->add_option("--timeout", scan_timeout, "Per-scan timeout in seconds")->check(CLI::PositiveNumber);

    // list
    bool list_online = false, list_offline = false;
    std::string list_group, list_format = "table";
    auto* list = app.add_subcommand("list", "Show known devices");
    auto* online_flag = list->add_flag("--online", list_online, "Only online devices");
    list->add_flag("--offline", list_offline, "Only offline devices")->excludes(online_flag);
    list->add_option("--group", list_group, "Only devices in this group (case-insensitive)");
    list->add_option("--format", list_format, "table|csv|json")
        ->check(CLI::IsMember({"table", "csv", "json"}))->capture_default_str();

    auto* networks = app.add_subcommand("networks", "Show detected local networks");
    auto* status   = app.add_subcommand("status", "Scanner availability and inventory summary");

    // edit
    std::string edit_ip, edit_label, edit_notes, edit_group;
    auto* edit = app.add_subcommand("edit", "Set label, notes or group of a device");
    edit->add_option("ip", edit_ip, "Device address")->required();
    auto* o_label = edit->add_option("--label", edit_label, "Label");
    auto* o_notes = edit->add_option("--notes", edit_notes, "Notes");
    auto* o_group = edit->add_option("--group", edit_group, "Group");

    std::string delete_ip;
    auto* del = app.add_subcommand("delete", "Remove a device from the inventory");
    del->add_option("ip", delete_ip, "Device address")->required();

    std::string export_file;
    auto* exp = app.add_subcommand("export", "Write the inventory as CSV");
    exp->add_option("file", export_file, "Output file")->required();

    auto* config_cmd = app.add_subcommand("config", "Print the effective configuration");
    auto* version    = app.add_subcommand("version", "Print the version");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (version->parsed()) {
        std::cout << "netroster " << NETROSTER_VERSION << "\n";
        return EXIT_OK;
    }

    // Config: defaults -> file -> flags
    Config cfg = default_config();
    std::string err;
    fs::path cfg_file = opt_config.empty() ? default_config_file() : fs::path(opt_config);
    std::error_code ec;
    if (!opt_config.empty() && !fs::exists(cfg_file, ec))
        return fail("config_not_found", cfg_file.string(), EXIT_USAGE);
    if (!load_config(cfg_file, cfg, err)) return fail("bad_config", err, EXIT_USAGE);
    if (!opt_data_dir.empty()) cfg.data_dir = opt_data_dir;
    if (opt_min_interval > 0)  cfg.min_scan_interval = std::chrono::seconds(opt_min_interval);
    if (scan_timeout > 0)      cfg.scan_timeout = std::chrono::seconds(scan_timeout);

    if (!init_logging(cfg.log_level)) return fail("bad_config", "unknown log level " + cfg.log_level, EXIT_USAGE);
    if (opt_verbose) init_logging("debug");
    if (opt_quiet)   init_logging("error");

    if (config_cmd->parsed()) {
        std::cout << config_to_json(cfg).dump(2) << "\n";
        return EXIT_OK;
    }
    if (networks->parsed()) return cmd_networks();

    Store store(cfg);
    if (!store.open(err)) return fail("store_open_failed", err);

    if (scan->parsed())   return cmd_scan(cfg, store, scan_range, scan_force);
    if (list->parsed())   return cmd_list(cfg, store, list_online, list_offline, list_group, list_format);
    if (status->parsed()) return cmd_status(cfg, store);
    if (exp->parsed())    return cmd_export(store, export_file);

    if (edit->parsed()) {
        if (!parse_ipv4(edit_ip)) return fail("invalid_ip", edit_ip, EXIT_USAGE);
        if (!o_label->count() && !o_notes->count() && !o_group->count())
            return fail("nothing_to_edit", "give --label, --notes or --group", EXIT_USAGE);
        std::optional<std::string> label, notes, group;
        if (o_label->count()) label = edit_label;
        if (o_notes->count()) notes = edit_notes;
        if (o_group->count()) group = edit_group;
        if (!store.update_device_fields(edit_ip, label, notes, group, err)) return store_fail(edit_ip, err);
        std::cout << "Updated " << edit_ip << "\n";
        return EXIT_OK;
    }

    if (del->parsed()) {
        if (!parse_ipv4(delete_ip)) return fail("invalid_ip", delete_ip, EXIT_USAGE);
        if (!store.delete_device(delete_ip, err)) return store_fail(delete_ip, err);
        std::cout << "Deleted " << delete_ip << "\n";
        return EXIT_OK;
    }

    return fail("unknown_command", {}, EXIT_USAGE);
}
