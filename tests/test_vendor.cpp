#include <doctest/doctest.h>
#include "netroster/vendor.hpp"

using namespace netroster;

TEST_CASE("normalize_oui upper-cases and zero-pads the first three octets") {
    auto k = normalize_oui("b8:27:eb:12:34:56");
    REQUIRE(k);
    CHECK(std::string(k->c_str()) == "B8:27:EB");

    k = normalize_oui("0-50-56-aa-bb-cc");
    REQUIRE(k);
    CHECK(std::string(k->c_str()) == "00:50:56");
}

TEST_CASE("normalize_oui rejects malformed input") {
    CHECK_FALSE(normalize_oui(""));
    CHECK_FALSE(normalize_oui("zz:27:eb:00:00:00"));
    CHECK_FALSE(normalize_oui("b8:27"));
    CHECK_FALSE(normalize_oui("b827eb123456"));
    CHECK_FALSE(normalize_oui("b8.27.eb.12.34.56"));
}

TEST_CASE("lookup_vendor maps known prefixes and falls back to Unknown") {
    CHECK(lookup_vendor("B8:27:EB:00:11:22") == "Raspberry Pi");
    CHECK(lookup_vendor("00:50:56:c0:00:08") == "VMware");
    CHECK(lookup_vendor("00-15-5d-01-02-03") == "Microsoft Hyper-V");
    CHECK(lookup_vendor("02:00:00:00:00:01") == UNKNOWN_VENDOR);
    CHECK(lookup_vendor("") == UNKNOWN_VENDOR);
    CHECK(lookup_vendor("not a mac") == UNKNOWN_VENDOR);
}
