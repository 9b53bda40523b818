/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Constants for the flight segmentation engine
 *
 * Column names of the position-record files, default thresholds and time
 * conversion factors, collected in one place instead of being scattered
 * through the code as magic numbers.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace flight_seg {

// ============================================================================
// Time
// ============================================================================

/// Timestamps are milliseconds since the Unix epoch, UTC
using Timestamp = std::int64_t;

constexpr Timestamp MS_PER_SECOND = 1000;
constexpr Timestamp MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr Timestamp MS_PER_HOUR = 60 * MS_PER_MINUTE;

/// tm_year counts from 1900
constexpr int TM_YEAR_BASE = 1900;

/// Ordinal days are written zero-padded to this width
constexpr int ORDINAL_DAY_WIDTH = 3;

// ============================================================================
// Input / Output Columns
// ============================================================================

constexpr const char *COL_TIMESTAMP = "timestamp";
constexpr const char *COL_AIRCRAFT = "icao_address";
constexpr const char *COL_LATITUDE = "latitude";
constexpr const char *COL_LONGITUDE = "longitude";
constexpr const char *COL_ORIGIN = "departure_airport_icao";
constexpr const char *COL_DESTINATION = "arrival_airport_icao";
constexpr const char *COL_FLIGHT_ID = "flight_id";

/// Columns of the flight info table
constexpr const char *COL_FIRST_MESSAGE = "first_message_timestamp";
constexpr const char *COL_LAST_MESSAGE = "last_message_timestamp";
constexpr const char *COL_MESSAGE_COUNT = "number_of_messages";

/// Columns of the airports table used by the route scope
constexpr const char *COL_AIRPORT_ICAO = "icao";
constexpr const char *COL_AIRPORT_COUNTRY = "iso_country";

constexpr char CSV_SEPARATOR = ',';
constexpr char CSV_QUOTE = '"';

// ============================================================================
// Segmentation Defaults
// ============================================================================

/// "Soft" in-air gap needing consistency checks (reserved, not consulted)
constexpr double DEFAULT_SOFT_GAP_MINUTES = 45.0;

/// Long ground gap between flights (reserved, not consulted)
constexpr double DEFAULT_LONG_GROUND_GAP_MINUTES = 50.0;

/// Gap that always starts a new flight
constexpr double DEFAULT_HARD_GAP_HOURS = 6.0;

/// Large spatial jump threshold (reserved, not consulted)
constexpr double DEFAULT_MAX_JUMP_KM = 500.0;

/// In-air heading continuity threshold (reserved, not consulted)
constexpr double DEFAULT_SAME_HEADING_DEGREES = 90.0;

/// Candidate flights with this many records or fewer are noise
constexpr std::size_t DEFAULT_MIN_CONSECUTIVE_POINTS = 3;

/// How long a flight stays open for continuation into the next chunk
constexpr double DEFAULT_LOOKBACK_HORIZON_HOURS = 6.0;

/// Number of input files read per chunk
constexpr std::size_t DEFAULT_CHUNK_SIZE_FILES = 5;

// ============================================================================
// Output Defaults
// ============================================================================

constexpr const char *DEFAULT_OUTPUT_DIR = "flights_with_ids";
constexpr const char *DEFAULT_OUTPUT_PREFIX = "flights";
constexpr const char *PARTITION_DAY_TAG = "_day_";
constexpr const char *PARTITION_EXTENSION = ".csv";
constexpr const char *DEFAULT_SCOPE_COUNTRY = "GB";
constexpr const char *DEFAULT_LOG_LEVEL = "info";

} // namespace flight_seg
