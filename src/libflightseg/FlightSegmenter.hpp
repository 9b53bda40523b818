/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Turns one chunk of position reports into labelled flights.
 *
 * The segmenter holds only configuration. Everything that must survive
 * from one chunk to the next goes in and comes out explicitly:
 *
 *   (records, previous tail snapshot, next flight id)
 *       -> (labelled records, new tail snapshot, new next flight id)
 *
 * Stages, in order: TrackRepairer, CandidateGrouper, ContinuityMatcher,
 * NoiseFilter (new flights only), GapSplitter.
 */

#pragma once

#include <cstddef>
#include <iostream>
#include <optional>
#include <vector>

#include "FlightTailState.hpp"
#include "PositionRecord.hpp"
#include "SegmentationConfig.hpp"

namespace flight_seg {

struct SegmentationStats {
    std::size_t recordsIn{0};
    std::size_t recordsRepaired{0};
    std::size_t aircraftDropped{0};
    std::size_t candidates{0};
    std::size_t flightsContinued{0};
    std::size_t recordsContinued{0};
    std::size_t noiseCandidatesDropped{0};
    std::size_t noiseRecordsDropped{0};
    std::size_t newFlights{0};
    std::size_t gapSplits{0};
    std::size_t recordsOut{0};
    std::size_t openTails{0};
    std::size_t collapsedTails{0};
    std::optional<FlightId> minFlightId;
    std::optional<FlightId> maxFlightId;

    void dump(std::ostream &outStream) const;
};

struct SegmentationResult {
    // Sorted by (aircraft, time); every record has a flight id
    std::vector<FlightRecord> records;
    FlightTailState tailState;
    FlightId nextFlightId{0};
    SegmentationStats stats;
};

class FlightSegmenter
{
  public:
    explicit FlightSegmenter(const SegmentationConfig &config);

    /**
     * Segment one chunk.
     *
     * @param records The chunk's raw records, in any order
     * @param previous Tail snapshot from the previous chunk (empty at start)
     * @param nextFlightId Lowest id not yet issued by any earlier chunk
     */
    [[nodiscard]] SegmentationResult segment(std::vector<PositionRecord> records, const FlightTailState &previous,
                                             FlightId nextFlightId) const;

    [[nodiscard]] const SegmentationConfig &config() const { return m_config; }

  private:
    SegmentationConfig m_config;
};

} // namespace flight_seg
