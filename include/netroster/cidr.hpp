#pragma once
/**
 * @file cidr.hpp
 * @brief Strict IPv4 / CIDR parsing and formatting.
 *
 * Everything that accepts an address or target range from outside (CLI args,
 * tool output, edit requests) goes through these parsers first, so malformed
 * input is rejected before any process is spawned or file is written.
 *
 * Addresses are held in host byte order (a.b.c.d -> a<<24 | b<<16 | c<<8 | d).
 */

#include <cstdint>
#include <optional>
#include <string>

namespace netroster {

/**
 * @struct Ipv4Net
 * @brief Address + prefix length. The address may still carry host bits;
 *        canonical() clears them.
 */
struct Ipv4Net {
    uint32_t address{0};
    int prefix_len{0};

    Ipv4Net canonical() const;
    bool contains(uint32_t addr) const;
    std::string to_string() const;   ///< "a.b.c.d/len" of this value as stored
};

/** @brief Dotted quad, exactly four decimal octets 0..255, no leading zeros. */
std::optional<uint32_t> parse_ipv4(const std::string& text);

/** @brief "a.b.c.d/len", len 0..32. Host bits are allowed. */
std::optional<Ipv4Net> parse_cidr(const std::string& text);

std::string format_ipv4(uint32_t addr);

/** @brief Netmask for a prefix length (0 -> 0.0.0.0, 32 -> 255.255.255.255). */
uint32_t prefix_mask(int prefix_len);

/** @brief Prefix length of a contiguous netmask, or -1 if the mask has holes. */
int mask_to_prefix(uint32_t mask);

/** @brief Numeric sort key; anything that is not a valid IPv4 sorts last. */
uint64_t ipv4_sort_key(const std::string& text);

} // namespace netroster
