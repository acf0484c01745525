#include <doctest/doctest.h>
#include "netroster/export.hpp"
#include "test_util.hpp"

#include <sstream>

using namespace netroster;
using namespace std::chrono_literals;
using testutil::at;

namespace {

Device make(const char* ip, const char* group, Timestamp last) {
    Device d;
    d.ip = ip;
    d.group = group;
    d.first_seen = last;
    d.last_seen = last;
    return d;
}

} // namespace

TEST_CASE("sort_by_address is numeric with invalid addresses last") {
    std::vector<Device> v = {make("192.168.1.10", "", {}), make("bogus", "", {}),
                             make("192.168.1.9", "", {}), make("10.0.0.1", "", {})};
    sort_by_address(v);
    CHECK(v[0].ip == "10.0.0.1");
    CHECK(v[1].ip == "192.168.1.9");
    CHECK(v[2].ip == "192.168.1.10");
    CHECK(v[3].ip == "bogus");
}

TEST_CASE("filter_devices by status and case-insensitive group") {
    const Timestamp now = at("2026-10-18T12:00:00Z");
    std::vector<Device> v = {make("10.0.0.1", "Lab", now - 1min), make("10.0.0.2", "lab", now - 3h),
                             make("10.0.0.3", "Office", now - 1min)};

    CHECK(filter_devices(v, false, false, "", now, 1h).size() == 3);
    CHECK(filter_devices(v, true, false, "", now, 1h).size() == 2);
    auto off = filter_devices(v, false, true, "", now, 1h);
    REQUIRE(off.size() == 1);
    CHECK(off[0].ip == "10.0.0.2");
    CHECK(filter_devices(v, false, false, "LAB", now, 1h).size() == 2);
    CHECK(filter_devices(v, true, false, "lab", now, 1h).size() == 1);
}

TEST_CASE("device_status distinguishes recent, seen and offline") {
    const Timestamp now = at("2026-10-18T12:00:00Z");
    StatusThresholds th;
    CHECK(std::string(device_status(make("1.1.1.1", "", now - 1min), now, th)) == "online");
    CHECK(std::string(device_status(make("1.1.1.1", "", now - 30min), now, th)) == "seen");
    CHECK(std::string(device_status(make("1.1.1.1", "", now - 2h), now, th)) == "offline");
    CHECK(std::string(device_status(make("1.1.1.1", "", {}), now, th)) == "offline");
}

TEST_CASE("CSV header, UTC times and RFC 4180 quoting") {
    Device d = make("192.168.1.3", "Office", at("2026-10-18T09:24:00.75Z"));
    d.label = "printer, \"hp\"";
    d.notes = "line1\nline2";
    std::ostringstream out;
    write_csv({d}, out);
    CHECK(out.str() ==
          "IP,MAC,Hostname,Vendor,Label,Notes,Group,First Seen,Last Seen\n"
          "192.168.1.3,,,,\"printer, \"\"hp\"\"\",\"line1\nline2\",Office,"
          "2026-10-18 09:24:00,2026-10-18 09:24:00\n");

    CHECK(csv_field("plain") == "plain");
    CHECK(csv_field("a\rb") == "\"a\rb\"");
}

TEST_CASE("table output truncates long names and handles the empty list") {
    std::ostringstream empty;
    write_table({}, Clock::now(), StatusThresholds{}, empty);
    CHECK(empty.str() == "No devices found\n");

    const Timestamp now = at("2026-10-18T12:00:00Z");
    Device d = make("192.168.1.2", "", now - 1min);
    d.hostname = "a-very-long-hostname-that-goes-on.example.lan";
    d.vendor = "Some Extremely Long Vendor Name Inc.";
    std::ostringstream out;
    write_table({d}, now, StatusThresholds{}, out);
    const std::string s = out.str();
    CHECK(s.rfind("IP", 0) == 0);
    CHECK(s.find("STATUS") != std::string::npos);
    CHECK(s.find("a-very-long-hostname-t...") != std::string::npos);
    CHECK(s.find("Some Extremely Lo...") != std::string::npos);
    CHECK(s.find("online") != std::string::npos);
    CHECK(s.find("a-very-long-hostname-that") == std::string::npos);
}

TEST_CASE("JSON listing uses the persisted record shape") {
    Device d = make("192.168.1.2", "Lab", at("2026-10-18T09:00:00Z"));
    d.response_time_ms = 1.5;
    std::ostringstream out;
    write_json({d}, out);
    auto j = nlohmann::json::parse(out.str());
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    CHECK(j[0]["ip"] == "192.168.1.2");
    CHECK(j[0]["group"] == "Lab");
    CHECK(j[0]["last_seen"] == "2026-10-18T09:00:00Z");
    CHECK(j[0]["response_time"] == 1.5);
}
