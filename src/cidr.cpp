// ============================================================================
// cidr.cpp — implementation for cidr.hpp
// ============================================================================

#include "netroster/cidr.hpp"

#include <cctype>

namespace netroster {

// Parse a run of 1..max_digits decimal digits at s[pos], no sign, no spaces,
// no leading zeros.
static bool parse_decimal(const std::string& s, size_t& pos, size_t max_digits, uint32_t& out) {
    size_t start = pos;
    uint32_t v = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        if (pos - start >= max_digits) return false;
        v = v * 10 + static_cast<uint32_t>(s[pos] - '0');
        ++pos;
    }
    if (pos == start) return false;
    if (pos - start > 1 && s[start] == '0') return false;   // "010" is ambiguous (octal in inet_aton)
    out = v;
    return true;
}

// Dotted quad starting at s[pos]; stops at the first char after the 4th octet.
static bool parse_quad(const std::string& s, size_t& pos, uint32_t& out) {
    uint32_t addr = 0;
    for (int i = 0; i < 4; ++i) {
        if (i > 0) {
            if (pos >= s.size() || s[pos] != '.') return false;
            ++pos;
        }
        uint32_t octet = 0;
        if (!parse_decimal(s, pos, 3, octet) || octet > 255) return false;
        addr = (addr << 8) | octet;
    }
    out = addr;
    return true;
}

std::optional<uint32_t> parse_ipv4(const std::string& text) {
    size_t pos = 0;
    uint32_t addr = 0;
    if (!parse_quad(text, pos, addr) || pos != text.size()) return std::nullopt;
    return addr;
}

std::optional<Ipv4Net> parse_cidr(const std::string& text) {
    size_t pos = 0;
    uint32_t addr = 0;
    if (!parse_quad(text, pos, addr)) return std::nullopt;
    if (pos >= text.size() || text[pos] != '/') return std::nullopt;
    ++pos;
    uint32_t len = 0;
    if (!parse_decimal(text, pos, 2, len) || pos != text.size() || len > 32) return std::nullopt;
    return Ipv4Net{addr, static_cast<int>(len)};
}

uint32_t prefix_mask(int prefix_len) {
    if (prefix_len <= 0) return 0;
    if (prefix_len >= 32) return 0xFFFFFFFFu;
    return ~((1u << (32 - prefix_len)) - 1u);
}

int mask_to_prefix(uint32_t mask) {
    int len = 0;
    while (len < 32 && (mask & (0x80000000u >> len))) ++len;
    return (prefix_mask(len) == mask) ? len : -1;
}

std::string format_ipv4(uint32_t a) {
    return std::to_string((a >> 24) & 0xFF) + "." + std::to_string((a >> 16) & 0xFF) + "." +
           std::to_string((a >> 8) & 0xFF)  + "." + std::to_string(a & 0xFF);
}

Ipv4Net Ipv4Net::canonical() const {
    return Ipv4Net{address & prefix_mask(prefix_len), prefix_len};
}

bool Ipv4Net::contains(uint32_t addr) const {
    const uint32_t m = prefix_mask(prefix_len);
    return (addr & m) == (address & m);
}

std::string Ipv4Net::to_string() const {
    return format_ipv4(address) + "/" + std::to_string(prefix_len);
}

uint64_t ipv4_sort_key(const std::string& text) {
    auto a = parse_ipv4(text);
    return a ? static_cast<uint64_t>(*a) : UINT64_MAX;
}

} // namespace netroster
