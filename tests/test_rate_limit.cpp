#include <doctest/doctest.h>
#include "netroster/rate_limit.hpp"
#include "netroster/scanner.hpp"
#include "test_util.hpp"

using namespace netroster;
using namespace std::chrono_literals;

TEST_CASE("never scanned is always allowed") {
    auto d = check_rate_limit(Timestamp{}, 30s, Clock::now());
    CHECK(d.allowed);
    CHECK(d.wait == 0ms);
}

TEST_CASE("inside the interval the wait shrinks as time passes") {
    const Timestamp last = testutil::at("2026-10-18T09:00:00Z");
    auto d1 = check_rate_limit(last, 30s, last + 1s);
    auto d2 = check_rate_limit(last, 30s, last + 10s);
    auto d3 = check_rate_limit(last, 30s, last + 29500ms);
    CHECK_FALSE(d1.allowed);
    CHECK_FALSE(d2.allowed);
    CHECK_FALSE(d3.allowed);
    CHECK(d1.wait == 29s);
    CHECK(d2.wait < d1.wait);
    CHECK(d3.wait < d2.wait);
    CHECK(d3.wait > 0ms);
    CHECK(wait_seconds(d3) == 1);

    CHECK(check_rate_limit(last, 30s, last + 30s).allowed);
    CHECK(check_rate_limit(last, 30s, last + 1h).allowed);
}

TEST_CASE("a last scan in the future counts as just scanned") {
    const Timestamp now = testutil::at("2026-10-18T09:00:00Z");
    auto d = check_rate_limit(now + 5min, 30s, now);
    CHECK_FALSE(d.allowed);
    CHECK(d.wait == 30s);
}

TEST_CASE("Scanner::check_rate_limit uses the configured interval") {
    Config cfg;
    cfg.min_scan_interval = 120s;
    Scanner scanner(cfg, {});
    const Timestamp last = testutil::at("2026-10-18T09:00:00Z");
    CHECK_FALSE(scanner.check_rate_limit(last, last + 60s).allowed);
    CHECK(scanner.check_rate_limit(last, last + 120s).allowed);
}
