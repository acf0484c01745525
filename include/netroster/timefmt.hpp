#pragma once
/**
 * @file timefmt.hpp
 * @brief RFC 3339 timestamps for the persisted JSON files and human output.
 *
 * Persisted form is UTC with up to nine fractional digits, trailing zeros
 * trimmed (e.g. "2026-10-18T09:24:00.5Z"). The unset Timestamp is written as
 * "0001-01-01T00:00:00Z" so files stay readable by tools that expect a
 * zero time rather than a missing key.
 *
 * Parsing accepts:
 *   - 'Z' or a numeric "+hh:mm" / "-hh:mm" offset,
 *   - an optional fraction of 1..9 digits,
 *   - 't'/'z' in lower case.
 * Any date before 1970 maps to the unset Timestamp.
 */

#include <string>

#include "netroster/device.hpp"

namespace netroster {

/** @brief Format @p t as RFC 3339 UTC (nanosecond precision, trimmed). */
std::string format_rfc3339(Timestamp t);

/**
 * @brief Parse an RFC 3339 timestamp.
 * @return false on malformed input; @p out is untouched in that case.
 */
bool parse_rfc3339(const std::string& text, Timestamp& out);

/** @brief "YYYY-MM-DD HH:MM:SS" in UTC, or empty when @p t is unset. */
std::string format_short(Timestamp t);

} // namespace netroster
