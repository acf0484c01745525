#pragma once
/**
 * @file vendor.hpp
 * @brief Hardware-address prefix (OUI) to manufacturer name lookup.
 *
 * A small, static table covering the devices most often found on home and lab
 * LANs (virtualisation hosts, single-board computers, common router and laptop
 * vendors). It is a fallback only: when a probe backend already reports a
 * vendor string, that string wins.
 *
 * Keys are fixed-capacity ETL strings of the form "AA:BB:CC"; the table is an
 * etl::flat_map built once on first use, so lookups never allocate.
 */

#include <optional>
#include <string>

#include "etl/string.h"

namespace netroster {

/// "AA:BB:CC": eight characters, upper-case hex, colon separated
using OuiKey = etl::string<8>;

/// Returned when no table entry matches or the address is malformed.
inline constexpr const char* UNKNOWN_VENDOR = "Unknown";

/**
 * @brief Extract the OUI key from a hardware address.
 *
 * Accepts ':' or '-' separators and one- or two-digit octets in either case
 * ("0:c:29:..." becomes "00:0C:29"). Only the first three octets are read.
 *
 * @return the key, or std::nullopt if fewer than three valid octets lead the string.
 */
std::optional<OuiKey> normalize_oui(const std::string& mac);

/** @brief Vendor name for @p mac, or "Unknown". */
std::string lookup_vendor(const std::string& mac);

} // namespace netroster
