/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Conversions between UTC timestamp text and epoch milliseconds.
 */

#pragma once

#include <optional>
#include <string>

#include "SegmentationConstants.hpp"

namespace flight_seg {

/**
 * Parse a UTC timestamp such as
 *   2024-01-01 00:00:00
 *   2024-01-01 00:00:00.250 UTC
 *   2024-01-01T00:00:00Z
 *
 * Fractional seconds are kept to millisecond precision. Returns nullopt if
 * the text isn't a timestamp or names a zone other than UTC.
 */
[[nodiscard]] std::optional<Timestamp> parseTimestamp(const std::string &text);

/// Format as "YYYY-MM-DD HH:MM:SS.mmm UTC"
[[nodiscard]] std::string formatTimestamp(Timestamp ts);

/// Ordinal day of the year, 1..366, of the UTC calendar date
[[nodiscard]] int ordinalDay(Timestamp ts);

/// Convert an hour/minute threshold to milliseconds
[[nodiscard]] Timestamp hoursToMs(double hours);
[[nodiscard]] Timestamp minutesToMs(double minutes);

} // namespace flight_seg
