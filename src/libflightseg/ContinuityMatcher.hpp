/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Recognizes candidate flights that continue a flight left open by
 * the previous chunk.
 *
 */

#pragma once

#include <cstddef>
#include <vector>

#include "FlightTailState.hpp"
#include "PositionRecord.hpp"
#include "SegmentationConfig.hpp"

namespace flight_seg {

class ContinuityMatcher
{
  public:
    struct Result {
        // Records relabelled with the id of the flight they continue
        std::vector<FlightRecord> continued;
        // Records of candidates that start a new flight; no flight id yet
        std::vector<FlightRecord> fresh;
        std::size_t flightsContinued{0};
    };

    explicit ContinuityMatcher(const SegmentationConfig &config);

    /**
     * Split grouped records into continued and new streams.
     *
     * For every OD key, the first candidate of the chunk is a continuation
     * when the previous chunk left a flight open on that key, the candidate
     * starts within the lookback horizon of the chunk's first record, and it
     * starts no more than min(lookback horizon, hard gap) after the open
     * flight's last record. Only that first candidate is relabelled; the OD
     * key recurring later in the chunk is a new journey.
     *
     * @param records Output of CandidateGrouper, sorted by (aircraft, time)
     * @param previous Snapshot left by the previous chunk; may be empty
     */
    [[nodiscard]] Result match(std::vector<FlightRecord> records, const FlightTailState &previous) const;

  private:
    Timestamp m_lookbackMs;
    Timestamp m_continuationLimitMs;
};

} // namespace flight_seg
