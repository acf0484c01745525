#include <doctest/doctest.h>
#include "netroster/cidr.hpp"

using namespace netroster;

TEST_CASE("parse_ipv4 accepts dotted quads only") {
    auto a = parse_ipv4("192.168.1.10");
    REQUIRE(a);
    CHECK(*a == 0xC0A8010Au);
    CHECK(parse_ipv4("0.0.0.0"));
    CHECK(parse_ipv4("255.255.255.255"));

    CHECK_FALSE(parse_ipv4(""));
    CHECK_FALSE(parse_ipv4("192.168.1"));
    CHECK_FALSE(parse_ipv4("192.168.1.256"));
    CHECK_FALSE(parse_ipv4("192.168.1.1.1"));
    CHECK_FALSE(parse_ipv4("192.168.1.1 "));
    CHECK_FALSE(parse_ipv4("a.b.c.d"));
    CHECK_FALSE(parse_ipv4("192.168.1.0/24"));
}

TEST_CASE("parse_cidr accepts prefix 0..32 and keeps host bits until canonical()") {
    auto n = parse_cidr("192.168.1.10/24");
    REQUIRE(n);
    CHECK(n->prefix_len == 24);
    CHECK(n->to_string() == "192.168.1.10/24");
    CHECK(n->canonical().to_string() == "192.168.1.0/24");

    CHECK(parse_cidr("0.0.0.0/0"));
    CHECK(parse_cidr("10.0.0.1/32"));
    CHECK_FALSE(parse_cidr("10.0.0.1/33"));
    CHECK_FALSE(parse_cidr("10.0.0.1"));
    CHECK_FALSE(parse_cidr("10.0.0.1/"));
    CHECK_FALSE(parse_cidr("not-a-cidr"));
    CHECK_FALSE(parse_cidr("10.0.0.1/24/8"));
}

TEST_CASE("leading zeros are rejected so one address has one spelling") {
    CHECK_FALSE(parse_ipv4("010.0.0.1"));
    CHECK_FALSE(parse_ipv4("10.0.0.01"));
    CHECK_FALSE(parse_ipv4("10.00.0.1"));
    CHECK(parse_ipv4("10.0.0.1"));
    CHECK(parse_ipv4("0.0.0.0"));

    CHECK_FALSE(parse_cidr("010.0.0.0/8"));
    CHECK_FALSE(parse_cidr("10.0.0.0/08"));
    CHECK(parse_cidr("10.0.0.0/0"));
    CHECK(parse_cidr("10.0.0.0/8"));
}

TEST_CASE("masks and containment") {
    CHECK(prefix_mask(0) == 0u);
    CHECK(prefix_mask(24) == 0xFFFFFF00u);
    CHECK(prefix_mask(32) == 0xFFFFFFFFu);
    CHECK(mask_to_prefix(0xFFFFFF00u) == 24);
    CHECK(mask_to_prefix(0xFF00FF00u) == -1);

    Ipv4Net net{*parse_ipv4("10.1.2.0"), 23};
    CHECK(net.contains(*parse_ipv4("10.1.3.200")));
    CHECK_FALSE(net.contains(*parse_ipv4("10.1.4.1")));
}

TEST_CASE("ipv4_sort_key orders numerically, invalid last") {
    CHECK(ipv4_sort_key("192.168.1.9") < ipv4_sort_key("192.168.1.10"));
    CHECK(ipv4_sort_key("10.0.0.1") < ipv4_sort_key("192.168.0.1"));
    CHECK(ipv4_sort_key("garbage") > ipv4_sort_key("255.255.255.255"));
}
