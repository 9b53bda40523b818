/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Splits flights at time gaps longer than the hard-gap threshold.
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

class GapSplitter
{
  public:
    explicit GapSplitter(Timestamp hardGapMs) : m_hardGapMs(hardGapMs) {}

    /**
     * Split the new flights of a chunk.
     *
     * Every record more than the hard gap after the previous record of the
     * same flight sets a flag; the running sum of the flags over the whole
     * chunk is added to each record's id. Ids therefore stay dense and
     * unique, provided they never decrease along the (aircraft, time)
     * order, which is how NoiseFilter assigns them.
     *
     * @param records Labelled records, sorted by (aircraft, time)
     * @return The number of splits made
     */
    std::size_t splitNewFlights(std::vector<FlightRecord> &records) const;

    /**
     * Split flights continued from the previous chunk.
     *
     * Their ids were issued by an earlier chunk, so a shifted id could hit
     * another flight. Each segment after a gap instead takes nextFreeId,
     * which is then advanced.
     *
     * @param records Labelled records, sorted by (aircraft, time)
     * @return The number of splits made
     */
    std::size_t splitContinuedFlights(std::vector<FlightRecord> &records, FlightId &nextFreeId) const;

    /// Number of splits the records would still need; zero once split
    [[nodiscard]] std::size_t countGaps(const std::vector<FlightRecord> &records) const;

  private:
    [[nodiscard]] bool isGap(const FlightRecord &previous, const FlightRecord &current) const;

  private:
    Timestamp m_hardGapMs;
};

} // namespace flight_seg
