/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Fills in missing origin/destination airports along each aircraft's
 * track within one chunk.
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

class TrackRepairer
{
  public:
    struct Stats {
        std::size_t recordsIn{0};
        std::size_t recordsOut{0};
        std::size_t aircraftDropped{0};
        std::size_t originsFilled{0};
        std::size_t destinationsFilled{0};
    };

    /**
     * Repair one chunk's records.
     *
     * The records come back stably sorted by (aircraft, timestamp). Aircraft
     * with no origin anywhere in the chunk, or no destination anywhere, are
     * removed entirely. For the rest, each missing value takes the nearest
     * preceding value on that aircraft's track, or the nearest following one
     * when nothing precedes it.
     */
    [[nodiscard]] std::vector<PositionRecord> repair(std::vector<PositionRecord> records);

    [[nodiscard]] const Stats &lastStats() const { return m_stats; }

  private:
    using Field = std::optional<std::string> PositionRecord::*;

    static std::size_t fillTrack(std::vector<PositionRecord> &records, std::size_t begin, std::size_t end,
                                 Field field);

  private:
    Stats m_stats;
};

} // namespace flight_seg
