/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Minimal comma-separated-value line handling.
 *
 * Fields may be double-quoted; a doubled quote inside a quoted field is a
 * literal quote. A quoted field may hold line breaks, so one record can span
 * several physical lines; use readRecord() to collect it.
 */

#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace flight_seg::csv {

/**
 * Break a line into fields. A trailing '\r' is ignored.
 *
 * Throws std::invalid_argument if a quoted field isn't terminated.
 */
[[nodiscard]] std::vector<std::string> splitLine(const std::string &line);

/// Quote a field if it contains a separator, a quote or leading/trailing space.
[[nodiscard]] std::string escapeField(const std::string &field);

[[nodiscard]] std::string joinLine(const std::vector<std::string> &fields);

/// Index of a column in a header row, if present
[[nodiscard]] std::optional<std::size_t> findColumn(const std::vector<std::string> &header, const std::string &name);

/// getline() that also drops a trailing '\r'
bool readLine(std::istream &stream, std::string &line);

/**
 * Read one record: physical lines are joined with '\n' for as long as a
 * quoted field is left open. The record's trailing '\r' is dropped, those
 * inside quotes are kept.
 */
bool readRecord(std::istream &stream, std::string &record);

} // namespace flight_seg::csv
