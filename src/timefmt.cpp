// ============================================================================
// timefmt.cpp — implementation for timefmt.hpp
// ============================================================================

#include "netroster/timefmt.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace netroster {

using Nanos = std::chrono::nanoseconds;

static constexpr int64_t NS_PER_SEC = 1000000000LL;
static constexpr int64_t SEC_PER_DAY = 86400;

// ---------------------------------------------------------------------------
// Civil calendar <-> day count (days since 1970-01-01), proleptic Gregorian.
// Same arithmetic as the well-known days_from_civil/civil_from_days pair;
// avoids timegm()/gmtime_r() and their time_t range quirks.
// ---------------------------------------------------------------------------
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
}

static bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : DAYS[m - 1];
}

// Split a timestamp into whole seconds + sub-second nanos, flooring negatives.
static void split(Timestamp t, int64_t& secs, int64_t& nanos) {
    const int64_t ns = std::chrono::duration_cast<Nanos>(t.time_since_epoch()).count();
    secs  = ns / NS_PER_SEC;
    nanos = ns % NS_PER_SEC;
    if (nanos < 0) { nanos += NS_PER_SEC; --secs; }
}

std::string format_rfc3339(Timestamp t) {
    if (!is_set(t)) return "0001-01-01T00:00:00Z";

    int64_t secs = 0, nanos = 0;
    split(t, secs, nanos);

    int64_t days = secs / SEC_PER_DAY;
    int64_t rem  = secs % SEC_PER_DAY;
    if (rem < 0) { rem += SEC_PER_DAY; --days; }

    int64_t y = 0; unsigned mo = 0, d = 0;
    civil_from_days(days, y, mo, d);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld",
                  static_cast<long long>(y), mo, d,
                  static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem / 60) % 60),
                  static_cast<long long>(rem % 60));
    std::string out = buf;

    if (nanos != 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), "%09lld", static_cast<long long>(nanos));
        std::string f = frac;
        while (!f.empty() && f.back() == '0') f.pop_back();   // RFC3339Nano trims
        out += "." + f;
    }
    out += "Z";
    return out;
}

std::string format_short(Timestamp t) {
    if (!is_set(t)) return {};
    std::string full = format_rfc3339(t);     // YYYY-MM-DDTHH:MM:SS[.f]Z
    std::string out = full.substr(0, 19);
    out[10] = ' ';
    return out;
}

// ---------- parsing ----------

// Read exactly n digits at s[pos]; advances pos.
static bool read_digits(const std::string& s, size_t& pos, size_t n, int64_t& out) {
    if (pos + n > s.size()) return false;
    int64_t v = 0;
    for (size_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

static bool expect(const std::string& s, size_t& pos, char a, char b = '\0') {
    if (pos >= s.size()) return false;
    if (s[pos] != a && (b == '\0' || s[pos] != b)) return false;
    ++pos;
    return true;
}

bool parse_rfc3339(const std::string& s, Timestamp& out) {
    size_t p = 0;
    int64_t y, mo, d, hh, mm, ss;
    if (!read_digits(s, p, 4, y)  || !expect(s, p, '-') ||
        !read_digits(s, p, 2, mo) || !expect(s, p, '-') ||
        !read_digits(s, p, 2, d)  || !expect(s, p, 'T', 't') ||
        !read_digits(s, p, 2, hh) || !expect(s, p, ':') ||
        !read_digits(s, p, 2, mm) || !expect(s, p, ':') ||
        !read_digits(s, p, 2, ss))
        return false;

    if (mo < 1 || mo > 12) return false;
    if (d < 1 || d > static_cast<int64_t>(days_in_month(y, static_cast<unsigned>(mo)))) return false;
    if (hh > 23 || mm > 59 || ss > 60) return false;   // allow a leap second, folded below

    // optional fraction
    int64_t nanos = 0;
    if (p < s.size() && s[p] == '.') {
        ++p;
        size_t digits = 0;
        while (p < s.size() && std::isdigit(static_cast<unsigned char>(s[p]))) {
            if (digits < 9) nanos = nanos * 10 + (s[p] - '0');
            ++digits; ++p;
        }
        if (digits == 0) return false;
        for (size_t i = digits; i < 9; ++i) nanos *= 10;
    }

    // zone
    int64_t offset_s = 0;
    if (p >= s.size()) return false;
    if (s[p] == 'Z' || s[p] == 'z') {
        ++p;
    } else if (s[p] == '+' || s[p] == '-') {
        const int sign = (s[p] == '-') ? -1 : 1;
        ++p;
        int64_t oh, om;
        if (!read_digits(s, p, 2, oh) || !expect(s, p, ':') || !read_digits(s, p, 2, om))
            return false;
        if (oh > 23 || om > 59) return false;
        offset_s = sign * (oh * 3600 + om * 60);
    } else {
        return false;
    }
    if (p != s.size()) return false;

    if (y < 1970) {            // zero time and anything pre-epoch: unset
        out = Timestamp{};
        return true;
    }
    if (ss == 60) ss = 59;

    const int64_t days = days_from_civil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d));
    const int64_t secs = days * SEC_PER_DAY + hh * 3600 + mm * 60 + ss - offset_s;
    const Nanos since_epoch(secs * NS_PER_SEC + nanos);
    out = Timestamp(std::chrono::duration_cast<Clock::duration>(since_epoch));
    return true;
}

} // namespace netroster
