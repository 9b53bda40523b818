/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Drops candidate flights too short to be real and numbers the rest.
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

class NoiseFilter
{
  public:
    struct Stats {
        std::size_t candidatesIn{0};
        std::size_t candidatesDropped{0};
        std::size_t recordsDropped{0};
        std::size_t flightsOut{0};
        // survivors that resumed a continued flight across dropped noise
        std::size_t recordsRejoined{0};
    };

    explicit NoiseFilter(std::size_t minPoints) : m_minPoints(minPoints) {}

    /**
     * Remove every candidate with minPoints records or fewer, then give the
     * survivors flight ids firstFlightId, firstFlightId + 1, ... in
     * (aircraft, time) order.
     *
     * A surviving candidate keeps the flight of the nearest candidate before
     * it that was not dropped, provided both share an OD key. Runs of one key
     * separated only by noise therefore stay one flight, while a run that
     * sits between them (a continued flight included) still separates them.
     * Survivors that resume a continued flight that way take its id and are
     * moved onto the end of continued.
     *
     * @param records New-stream records, sorted by (aircraft, time)
     * @param continued Records already labelled as continuing earlier flights
     * @return The surviving records that start new flights, labelled
     */
    [[nodiscard]] std::vector<FlightRecord> filter(std::vector<FlightRecord> records, FlightId firstFlightId,
                                                   std::vector<FlightRecord> &continued);

    [[nodiscard]] std::vector<FlightRecord> filter(std::vector<FlightRecord> records, FlightId firstFlightId);

    [[nodiscard]] const Stats &lastStats() const { return m_stats; }

  private:
    std::size_t m_minPoints;
    Stats m_stats;
};

} // namespace flight_seg
