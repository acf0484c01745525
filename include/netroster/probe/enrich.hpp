#pragma once
/**
 * @file enrich.hpp
 * @brief Post-parse fill-in shared by every backend: vendor names and reverse DNS.
 *
 * Backends parse what their tool printed, then call enrich_devices() so both
 * produce the same shape of record:
 *   - vendor: kept if the tool supplied one, otherwise the OUI table lookup
 *     ("Unknown" when nothing matches or the MAC is missing/malformed);
 *   - hostname: kept if the tool supplied one, otherwise a reverse lookup
 *     bounded by a timeout. A slow or failing lookup just leaves it empty.
 */

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "netroster/device.hpp"
#include "netroster/scan_context.hpp"

namespace netroster::probe {

/// ip -> hostname, "" when unknown. Must not throw.
using ReverseResolver = std::function<std::string(const std::string& ip)>;

/**
 * @brief Reverse-resolve @p ip with the system resolver, waiting at most @p timeout.
 *
 * The lookup runs on a detached worker; if it overruns, its late answer is
 * discarded. Trailing dots are stripped.
 */
std::string reverse_dns(const std::string& ip, std::chrono::milliseconds timeout);

/** @brief reverse_dns() bound to a fixed timeout. */
ReverseResolver system_resolver(std::chrono::milliseconds timeout);

/**
 * @brief Fill vendor and hostname on every device in place.
 *
 * Reverse lookups stop once @p ctx expires; remaining hostnames stay empty.
 * A null @p resolve skips name resolution entirely.
 */
void enrich_devices(std::vector<Device>& devices, const ReverseResolver& resolve, const ScanContext& ctx);

} // namespace netroster::probe
