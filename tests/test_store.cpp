#include <doctest/doctest.h>
#include "netroster/atomic_file.hpp"
#include "netroster/store.hpp"
#include "test_util.hpp"

#include <atomic>
#include <fstream>
#include <thread>

using namespace netroster;
using namespace std::chrono_literals;
using testutil::at;

namespace {

Device seen(const char* ip, const char* mac, const char* host, const char* vendor) {
    Device d;
    d.ip = ip; d.mac = mac; d.hostname = host; d.vendor = vendor;
    return d;
}

std::string slurp(const std::filesystem::path& p) {
    std::string out, err;
    read_file(p, out, err);
    return out;
}

} // namespace

TEST_CASE("merge creates new devices with equal first/last seen and no annotations") {
    testutil::TempDir dir;
    Store store(testutil::config_in(dir.path));
    std::string err;
    REQUIRE(store.open(err));

    Device d = seen("192.168.1.2", "00:11:22:33:44:55", "nas", "Synology");
    d.label = "should not stick";
    const Timestamp t = at("2026-10-18T09:00:00Z");
    REQUIRE(store.merge_devices({d}, err, t));

    auto got = store.get_device("192.168.1.2");
    REQUIRE(got);
    CHECK(got->first_seen == t);
    CHECK(got->last_seen == t);
    CHECK(got->label.empty());
    CHECK(got->notes.empty());
    CHECK(got->group.empty());
    CHECK(got->hostname == "nas");
}

TEST_CASE("merge keeps annotations and first_seen, refreshes liveness") {
    testutil::TempDir dir;
    Store store(testutil::config_in(dir.path));
    std::string err;
    REQUIRE(store.open(err));

    const Timestamp t0 = at("2026-10-18T09:00:00Z");
    const Timestamp t1 = at("2026-10-18T10:00:00Z");
    REQUIRE(store.merge_devices({seen("10.0.0.5", "aa:bb:cc:dd:ee:ff", "tv", "LG")}, err, t0));
    REQUIRE(store.update_device_fields("10.0.0.5", std::string("TV"), std::nullopt, std::string("Living Room"), err));

    REQUIRE(store.merge_devices({seen("10.0.0.5", "aa:bb:cc:dd:ee:ff", "tv2", "LG")}, err, t1));
    auto d = store.get_device("10.0.0.5");
    REQUIRE(d);
    CHECK(d->label == "TV");
    CHECK(d->group == "Living Room");
    CHECK(d->hostname == "tv2");
    CHECK(d->first_seen == t0);
    CHECK(d->last_seen == t1);
}

TEST_CASE("merging the same discovery twice only advances last_seen") {
    testutil::TempDir dir;
    Store store(testutil::config_in(dir.path));
    std::string err;
    REQUIRE(store.open(err));

    const std::vector<Device> batch = {seen("192.168.1.2", "00:11:22:33:44:55", "a", "Acme"),
                                       seen("192.168.1.3", "00:11:22:33:44:66", "b", "Acme")};
    const Timestamp t0 = at("2026-10-18T09:00:00Z");
    const Timestamp t1 = at("2026-10-18T09:05:00Z");
    REQUIRE(store.merge_devices(batch, err, t0));
    auto first = store.get_devices();
    REQUIRE(store.merge_devices(batch, err, t1));
    auto second = store.get_devices();

    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        Device expected = first[i];
        expected.last_seen = t1;
        CHECK(second[i] == expected);
    }

    // older observation never moves last_seen back
    REQUIRE(store.merge_devices(batch, err, t0));
    CHECK(store.get_device("192.168.1.2")->last_seen == t1);
}

TEST_CASE("merge skips bad addresses and applies duplicates in order") {
    testutil::TempDir dir;
    Store store(testutil::config_in(dir.path));
    std::string err;
    REQUIRE(store.open(err));

    REQUIRE(store.merge_devices({seen("", "x", "", ""), seen("300.1.1.1", "y", "", ""),
                                 seen("10.0.0.7", "m1", "first", ""), seen("10.0.0.7", "m2", "second", "")},
                                err, at("2026-10-18T09:00:00Z")));
    auto all = store.get_devices();
    REQUIRE(all.size() == 1);
    CHECK(all[0].mac == "m2");
    CHECK(all[0].hostname == "second");
}

TEST_CASE("field edits touch only the annotations") {
    testutil::TempDir dir;
    Store store(testutil::config_in(dir.path));
    std::string err;
    REQUIRE(store.open(err));
    REQUIRE(store.merge_devices({seen("192.168.1.9", "00:50:56:00:00:09", "vm", "VMware")}, err,
                                at("2026-10-18T09:00:00Z")));
    const Device before = *store.get_device("192.168.1.9");

    REQUIRE(store.update_device_fields("192.168.1.9", std::string("Build box"), std::string("rack 2"),
                                       std::string("Lab"), err));
    const Device after = *store.get_device("192.168.1.9");
    CHECK(after.label == "Build box");
    CHECK(after.notes == "rack 2");
    CHECK(after.group == "Lab");
    CHECK(after.ip == before.ip);
    CHECK(after.mac == before.mac);
    CHECK(after.hostname == before.hostname);
    CHECK(after.vendor == before.vendor);
    CHECK(after.first_seen == before.first_seen);
    CHECK(after.last_seen == before.last_seen);

    // clearing a field is an explicit empty value
    REQUIRE(store.update_device_fields("192.168.1.9", std::nullopt, std::string(""), std::nullopt, err));
    CHECK(store.get_device("192.168.1.9")->notes.empty());
    CHECK(store.get_device("192.168.1.9")->label == "Build box");
}

TEST_CASE("edit and delete report unknown and invalid addresses") {
    testutil::TempDir dir;
    Store store(testutil::config_in(dir.path));
    std::string err;
    REQUIRE(store.open(err));

    CHECK_FALSE(store.update_device_fields("10.9.9.9", std::string("x"), std::nullopt, std::nullopt, err));
    CHECK(err == "device not found: 10.9.9.9");
    CHECK_FALSE(store.delete_device("10.9.9.9", err));
    CHECK(err == "device not found: 10.9.9.9");

    CHECK_FALSE(store.delete_device("nope", err));
    CHECK(err.find("invalid IP address") != std::string::npos);

    REQUIRE(store.merge_devices({seen("10.9.9.9", "", "", "")}, err, at("2026-10-18T09:00:00Z")));
    REQUIRE(store.delete_device("10.9.9.9", err));
    CHECK_FALSE(store.get_device("10.9.9.9"));
}

TEST_CASE("update_device backfills blanks and never rewinds last_seen") {
    testutil::TempDir dir;
    Store store(testutil::config_in(dir.path));
    std::string err;
    REQUIRE(store.open(err));

    const Timestamp t0 = at("2026-10-18T09:00:00Z");
    const Timestamp t1 = at("2026-10-18T10:00:00Z");
    REQUIRE(store.merge_devices({seen("10.0.0.5", "aa", "tv", "LG")}, err, t1));
    REQUIRE(store.update_device_fields("10.0.0.5", std::string("TV"), std::string("wall"), std::string("Living Room"), err));

    Device repl;
    repl.ip = "10.0.0.5";
    repl.mac = "bb";
    repl.label = "Telly";
    repl.last_seen = t0;
    REQUIRE(store.update_device(repl, err, t1));

    auto d = store.get_device("10.0.0.5");
    REQUIRE(d);
    CHECK(d->label == "Telly");
    CHECK(d->notes == "wall");
    CHECK(d->group == "Living Room");
    CHECK(d->mac == "bb");
    CHECK(d->first_seen == t1);
    CHECK(d->last_seen == t1);

    Device fresh;
    fresh.ip = "10.0.0.6";
    REQUIRE(store.update_device(fresh, err, t0));
    CHECK(store.get_device("10.0.0.6")->first_seen == t0);
    CHECK(store.get_device("10.0.0.6")->last_seen == t0);

    Device bad;
    bad.ip = "10.0.0";
    CHECK_FALSE(store.update_device(bad, err));
}

TEST_CASE("reload reproduces the map field for field") {
    testutil::TempDir dir;
    const Config cfg = testutil::config_in(dir.path);
    std::string err;

    std::vector<Device> before;
    {
        Store store(cfg);
        REQUIRE(store.open(err));
        Device a = seen("192.168.1.2", "00:11:22:33:44:55", "nas", "Synology");
        a.response_time_ms = 0.437;
        REQUIRE(store.merge_devices({a, seen("192.168.1.3", "", "", "Unknown")}, err,
                                    at("2026-10-18T09:00:00.123456789Z")));
        REQUIRE(store.update_device_fields("192.168.1.3", std::string("printer, \"hp\""), std::nullopt,
                                           std::string("Office"), err));
        REQUIRE(store.set_last_scan("192.168.1.0/24", at("2026-10-18T09:00:00.5Z"), err));
        before = store.get_devices();
    }

    Store again(cfg);
    REQUIRE(again.open(err));
    auto after = again.get_devices();
    REQUIRE(after.size() == before.size());
    for (size_t i = 0; i < before.size(); ++i) CHECK(after[i] == before[i]);
    CHECK(again.get_last_scan("192.168.1.0/24") == at("2026-10-18T09:00:00.5Z"));
    CHECK_FALSE(is_set(again.get_last_scan("10.0.0.0/8")));

    auto j = nlohmann::json::parse(slurp(again.devices_path()));
    CHECK(j["192.168.1.2"]["response_time"].get<double>() == doctest::Approx(0.437));
    CHECK_FALSE(j["192.168.1.3"].contains("response_time"));
}

TEST_CASE("a crash between temp write and rename leaves the previous file") {
    testutil::TempDir dir;
    auto target = dir.path / "devices.json";
    std::string err;
    REQUIRE(atomic_write(target, "{\"old\":true}", err));

    std::filesystem::path tmp;
    REQUIRE(write_temp(target, "{\"new\":true}", tmp, err));
    CHECK(tmp.parent_path() == dir.path);
    CHECK(tmp.filename().string().rfind(".tmp-", 0) == 0);
    CHECK(slurp(target) == "{\"old\":true}");       // "crash" here

    REQUIRE(commit_temp(tmp, target, err));
    CHECK(slurp(target) == "{\"new\":true}");
    CHECK_FALSE(std::filesystem::exists(tmp));
}

TEST_CASE("leftover temp files do not disturb loading") {
    testutil::TempDir dir;
    const Config cfg = testutil::config_in(dir.path);
    std::string err;
    {
        Store store(cfg);
        REQUIRE(store.open(err));
        REQUIRE(store.merge_devices({seen("10.0.0.1", "", "gw", "")}, err, at("2026-10-18T09:00:00Z")));
    }
    std::filesystem::path tmp;
    REQUIRE(write_temp(cfg.devices_file(), "{ half written", tmp, err));

    Store again(cfg);
    REQUIRE(again.open(err));
    REQUIRE(again.get_device("10.0.0.1"));
    CHECK(again.get_device("10.0.0.1")->hostname == "gw");
}

TEST_CASE("corrupt primary falls back to the backup, then to empty") {
    testutil::TempDir dir;
    const Config cfg = testutil::config_in(dir.path);
    std::string err;
    {
        Store store(cfg);
        REQUIRE(store.open(err));
        REQUIRE(store.merge_devices({seen("10.0.0.1", "", "one", "")}, err, at("2026-10-18T09:00:00Z")));
        REQUIRE(store.merge_devices({seen("10.0.0.2", "", "two", "")}, err, at("2026-10-18T09:01:00Z")));
        CHECK(std::filesystem::exists(store.backup_path()));
    }

    { std::ofstream(cfg.devices_file(), std::ios::trunc) << "{ this is not json"; }
    {
        Store store(cfg);
        REQUIRE(store.open(err));
        auto all = store.get_devices();
        REQUIRE(all.size() == 1);                    // backup is the state before the last write
        CHECK(all[0].ip == "10.0.0.1");
    }

    { std::ofstream(cfg.devices_file(), std::ios::trunc) << ""; }
    { std::ofstream(std::filesystem::path(cfg.devices_file()).concat(".backup"), std::ios::trunc) << "[]"; }
    {
        Store store(cfg);
        REQUIRE(store.open(err));
        CHECK(store.get_devices().empty());
    }

    { std::ofstream(cfg.state_file(), std::ios::trunc) << "garbage"; }
    Store store(cfg);
    REQUIRE(store.open(err));
    CHECK_FALSE(is_set(store.get_last_scan("10.0.0.0/24")));
}

TEST_CASE("a corrupt primary never replaces a good backup") {
    testutil::TempDir dir;
    const Config cfg = testutil::config_in(dir.path);
    std::string err;
    {
        Store store(cfg);
        REQUIRE(store.open(err));
        REQUIRE(store.merge_devices({seen("10.0.0.1", "", "one", "")}, err, at("2026-10-18T09:00:00Z")));
        REQUIRE(store.merge_devices({seen("10.0.0.2", "", "two", "")}, err, at("2026-10-18T09:01:00Z")));
    }
    { std::ofstream(cfg.devices_file(), std::ios::trunc) << "{ this is not json"; }

    Store store(cfg);
    REQUIRE(store.open(err));
    REQUIRE(store.get_devices().size() == 1);      // recovered from the backup
    REQUIRE(store.merge_devices({seen("10.0.0.3", "", "three", "")}, err, at("2026-10-18T09:02:00Z")));

    const std::string backup = slurp(store.backup_path());
    CHECK(backup.find("not json") == std::string::npos);
    CHECK_FALSE(nlohmann::json::parse(backup, nullptr, false).is_discarded());

    Store again(cfg);
    REQUIRE(again.open(err));
    CHECK(again.get_devices().size() == 2);
    CHECK(again.get_device("10.0.0.1"));
    CHECK(again.get_device("10.0.0.3"));
}

TEST_CASE("open fails only when the data directory cannot be created") {
    testutil::TempDir dir;
    auto blocker = dir.path / "file";
    { std::ofstream(blocker) << "x"; }
    Store store(testutil::config_in(blocker / "sub"));
    std::string err;
    CHECK_FALSE(store.open(err));
    CHECK_FALSE(err.empty());
}

TEST_CASE("reserve_scan is a check-and-set") {
    testutil::TempDir dir;
    Store store(testutil::config_in(dir.path));
    std::string err;
    REQUIRE(store.open(err));

    const Timestamp t0 = at("2026-10-18T09:00:00Z");
    RateDecision d;
    REQUIRE(store.reserve_scan("192.168.1.0/24", 30s, d, err, t0));
    CHECK(d.allowed);
    CHECK(store.get_last_scan("192.168.1.0/24") == t0);

    REQUIRE(store.reserve_scan("192.168.1.0/24", 30s, d, err, t0 + 10s));
    CHECK_FALSE(d.allowed);
    CHECK(d.wait == 20s);
    CHECK(store.get_last_scan("192.168.1.0/24") == t0);   // refusal does not move it

    REQUIRE(store.reserve_scan("10.0.0.0/24", 30s, d, err, t0 + 10s));
    CHECK(d.allowed);                                      // ranges are independent

    REQUIRE(store.reserve_scan("192.168.1.0/24", 30s, d, err, t0 + 30s));
    CHECK(d.allowed);
}

TEST_CASE("two stores on one directory see each other's writes") {
    testutil::TempDir dir;
    const Config cfg = testutil::config_in(dir.path);
    std::string err;

    Store a(cfg);
    REQUIRE(a.open(err));
    REQUIRE(a.merge_devices({seen("10.0.0.5", "", "tv", "")}, err, at("2026-10-18T09:00:00Z")));

    Store b(cfg);
    REQUIRE(b.open(err));
    REQUIRE(b.update_device_fields("10.0.0.5", std::string("TV"), std::nullopt, std::nullopt, err));

    // a still holds the snapshot from before the edit
    REQUIRE(a.merge_devices({seen("10.0.0.5", "", "tv2", "")}, err, at("2026-10-18T09:05:00Z")));
    CHECK(a.get_device("10.0.0.5")->label == "TV");

    Store fresh(cfg);
    REQUIRE(fresh.open(err));
    auto d = fresh.get_device("10.0.0.5");
    REQUIRE(d);
    CHECK(d->label == "TV");
    CHECK(d->hostname == "tv2");

    SUBCASE("a delete elsewhere makes a later edit miss") {
        REQUIRE(b.delete_device("10.0.0.5", err));
        CHECK_FALSE(a.update_device_fields("10.0.0.5", std::nullopt, std::string("n"), std::nullopt, err));
        CHECK(err == DEVICE_NOT_FOUND + std::string("10.0.0.5"));
        CHECK_FALSE(a.get_device("10.0.0.5"));
    }
    SUBCASE("a reservation elsewhere refuses the next one") {
        const Timestamp t0 = at("2026-10-18T10:00:00Z");
        RateDecision da, db;
        REQUIRE(a.reserve_scan("10.0.0.0/24", 30s, da, err, t0));
        CHECK(da.allowed);
        REQUIRE(b.reserve_scan("10.0.0.0/24", 30s, db, err, t0 + 5s));
        CHECK_FALSE(db.allowed);
        CHECK(db.wait == 25s);
    }
}

TEST_CASE("stats count online, offline and non-empty groups") {
    testutil::TempDir dir;
    Config cfg = testutil::config_in(dir.path);
    cfg.online_threshold = 3600s;
    Store store(cfg);
    std::string err;
    REQUIRE(store.open(err));

    const Timestamp now = at("2026-10-18T12:00:00Z");
    REQUIRE(store.merge_devices({seen("10.0.0.1", "", "", ""), seen("10.0.0.2", "", "", "")}, err, now - 10min));
    REQUIRE(store.merge_devices({seen("10.0.0.3", "", "", "")}, err, now - 2h));
    REQUIRE(store.update_device_fields("10.0.0.1", std::nullopt, std::nullopt, std::string("Lab"), err));
    REQUIRE(store.update_device_fields("10.0.0.3", std::nullopt, std::nullopt, std::string("Lab"), err));

    DeviceStats s = store.get_stats(now);
    CHECK(s.total == 3);
    CHECK(s.online == 2);
    CHECK(s.offline == 1);
    REQUIRE(s.groups.size() == 1);
    CHECK(s.groups["Lab"] == 2);
}

TEST_CASE("reconcile modes") {
    const Timestamp t0 = at("2026-10-18T09:00:00Z");
    const Timestamp t1 = at("2026-10-18T09:30:00Z");

    Device existing = seen("10.0.0.5", "aa", "tv", "LG");
    existing.label = "TV";
    existing.first_seen = t0;
    existing.last_seen = t1;

    Device obs = seen("10.0.0.5", "bb", "tv2", "LG");
    obs.label = "ignored";
    Device r = reconcile(&existing, obs, ReconcileMode::Observation, t0);
    CHECK(r.label == "TV");
    CHECK(r.mac == "bb");
    CHECK(r.last_seen == t1);                      // max(existing, now)

    Device repl;
    repl.ip = "10.0.0.5";
    r = reconcile(&existing, repl, ReconcileMode::Replace, t1);
    CHECK(r.label == "TV");
    CHECK(r.first_seen == t0);
    CHECK(r.last_seen == t1);
    CHECK(r.mac.empty());
}

TEST_CASE("concurrent writers and readers keep every record") {
    testutil::TempDir dir;
    const Config cfg = testutil::config_in(dir.path);
    std::string err;
    Store store(cfg);
    REQUIRE(store.open(err));

    constexpr int kWriters = 4;
    constexpr int kPerWriter = 10;
    std::atomic<bool> done{false};
    std::atomic<int> failures{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 2; ++r) {
        readers.emplace_back([&] {
            while (!done.load()) {
                auto s = store.get_stats();
                if (s.total != s.online + s.offline) ++failures;
                (void)store.get_devices();
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
            std::string werr;
            for (int i = 0; i < kPerWriter; ++i) {
                const std::string ip = "10.0." + std::to_string(w) + "." + std::to_string(i + 1);
                Device d;
                d.ip = ip;
                d.hostname = "h" + std::to_string(i);
                if (!store.merge_devices({d}, werr)) ++failures;
                if (!store.update_device_fields(ip, "w" + std::to_string(w), std::nullopt,
                                                std::string("g"), werr))
                    ++failures;
            }
        });
    }
    for (auto& t : writers) t.join();
    done = true;
    for (auto& t : readers) t.join();
    CHECK(failures.load() == 0);

    Store again(cfg);
    REQUIRE(again.open(err));
    CHECK(again.get_devices().size() == size_t(kWriters * kPerWriter));
    CHECK(again.get_stats().groups["g"] == size_t(kWriters * kPerWriter));
    for (int w = 0; w < kWriters; ++w) {
        for (int i = 0; i < kPerWriter; ++i) {
            auto d = again.get_device("10.0." + std::to_string(w) + "." + std::to_string(i + 1));
            REQUIRE(d);
            CHECK(d->label == "w" + std::to_string(w));
            CHECK(d->hostname == "h" + std::to_string(i));
        }
    }
}
