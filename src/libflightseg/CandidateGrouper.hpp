/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Splits a repaired chunk into candidate flights.
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

class CandidateGrouper
{
  public:
    /**
     * Label every record with a candidate id.
     *
     * The records are stably sorted by (aircraft, timestamp), then a single
     * scan starts a new candidate each time the OD key differs from the
     * previous record's. Ids are dense and start at zero. Every record must
     * have a complete route.
     *
     * @return The number of candidates
     */
    std::size_t group(std::vector<FlightRecord> &records) const;

    /// Wrap repaired positions and group them
    [[nodiscard]] std::vector<FlightRecord> group(std::vector<PositionRecord> positions) const;
};

} // namespace flight_seg
