#pragma once

#include "core/clock.h"
#include <optional>
#include <string>

namespace TimestampUtils {

/**
 * @brief Format a timestamp as UTC ISO 8601 with nanosecond fraction
 *
 * Example: 2026-10-19T08:30:00.123456789Z
 */
std::string toIso8601(const Timestamp &ts);

/**
 * @brief Parse a UTC ISO 8601 timestamp
 *
 * Accepts 0-9 fractional digits and an optional "Z" or "+00:00" suffix.
 * Other offsets are rejected.
 *
 * @return Timestamp if valid, nullopt otherwise
 */
std::optional<Timestamp> fromIso8601(const std::string &text);

} // namespace TimestampUtils
