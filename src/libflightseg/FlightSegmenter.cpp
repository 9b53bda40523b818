/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <utility>

#include "CandidateGrouper.hpp"
#include "ContinuityMatcher.hpp"
#include "FlightSegmenter.hpp"
#include "GapSplitter.hpp"
#include "Logging.hpp"
#include "NoiseFilter.hpp"
#include "TrackRepairer.hpp"

namespace flight_seg {

void SegmentationStats::dump(std::ostream &outStream) const
{
    outStream << "Chunk segmentation:" << "\n    records in: " << recordsIn << "\n    after repair: " << recordsRepaired
              << " (" << aircraftDropped << " aircraft dropped)" << "\n    candidates: " << candidates
              << "\n    continued: " << flightsContinued << " flights, " << recordsContinued << " records"
              << "\n    noise: " << noiseCandidatesDropped << " candidates, " << noiseRecordsDropped << " records"
              << "\n    new flights: " << newFlights << "\n    gap splits: " << gapSplits
              << "\n    records out: " << recordsOut << "\n    open tails: " << openTails << " (collapsed "
              << collapsedTails << ")";
    if (minFlightId.has_value() && maxFlightId.has_value()) {
        outStream << "\n    flight ids: " << minFlightId.value() << ".." << maxFlightId.value();
    }
    outStream << "\n";
}

FlightSegmenter::FlightSegmenter(const SegmentationConfig &config) : m_config(config) { m_config.validate(); }

SegmentationResult FlightSegmenter::segment(std::vector<PositionRecord> records, const FlightTailState &previous,
                                            FlightId nextFlightId) const
{
    SegmentationResult result;
    result.nextFlightId = nextFlightId;
    auto &stats = result.stats;
    stats.recordsIn = records.size();

    TrackRepairer repairer;
    auto repaired = repairer.repair(std::move(records));
    stats.recordsRepaired = repaired.size();
    stats.aircraftDropped = repairer.lastStats().aircraftDropped;
    if (repaired.empty()) {
        FLIGHTSEG_LOG_INFO("chunk has no usable records ({} read)", stats.recordsIn);
        return result;
    }

    CandidateGrouper grouper;
    std::vector<FlightRecord> grouped;
    grouped.reserve(repaired.size());
    for (auto &position : repaired) {
        grouped.emplace_back(std::move(position));
    }
    stats.candidates = grouper.group(grouped);

    ContinuityMatcher matcher(m_config);
    auto matched = matcher.match(std::move(grouped), previous);
    stats.flightsContinued = matched.flightsContinued;

    NoiseFilter noiseFilter(m_config.minConsecutivePoints);
    auto fresh = noiseFilter.filter(std::move(matched.fresh), nextFlightId, matched.continued);
    stats.noiseCandidatesDropped = noiseFilter.lastStats().candidatesDropped;
    stats.noiseRecordsDropped = noiseFilter.lastStats().recordsDropped;
    if (noiseFilter.lastStats().recordsRejoined > 0) {
        sortByAircraftAndTime(matched.continued);
    }
    stats.recordsContinued = matched.continued.size();

    GapSplitter splitter(m_config.hardGapMs());
    std::size_t freshSplits = splitter.splitNewFlights(fresh);
    stats.newFlights = noiseFilter.lastStats().flightsOut + freshSplits;

    // continued-flight segments take ids after every new flight of this chunk
    FlightId nextFreeId = nextFlightId + static_cast<FlightId>(stats.newFlights);
    std::size_t continuedSplits = splitter.splitContinuedFlights(matched.continued, nextFreeId);
    stats.gapSplits = freshSplits + continuedSplits;

    auto &out = result.records;
    out.reserve(matched.continued.size() + fresh.size());
    for (auto &record : matched.continued) {
        out.push_back(std::move(record));
    }
    for (auto &record : fresh) {
        out.push_back(std::move(record));
    }
    sortByAircraftAndTime(out);
    stats.recordsOut = out.size();

    for (const auto &record : out) {
        FlightId id = record.flightId.value();
        stats.minFlightId = std::min(stats.minFlightId.value_or(id), id);
        stats.maxFlightId = std::max(stats.maxFlightId.value_or(id), id);
    }
    if (stats.maxFlightId.has_value()) {
        result.nextFlightId = std::max(nextFlightId, stats.maxFlightId.value() + 1);
    }

    result.tailState = FlightTailState::fromChunkOutput(out, m_config.lookbackHorizonMs());
    stats.openTails = result.tailState.size();
    stats.collapsedTails = result.tailState.collapsedTails();

    FLIGHTSEG_LOG_INFO("segmented {} records into {} ({} continued flights, {} new, {} gap splits, {} noise "
                       "candidates dropped)",
                       stats.recordsIn, stats.recordsOut, stats.flightsContinued, stats.newFlights, stats.gapSplits,
                       stats.noiseCandidatesDropped);
    if (stats.minFlightId.has_value()) {
        FLIGHTSEG_LOG_DEBUG("flight ids {}..{}, next {}, open tails {}", stats.minFlightId.value(),
                            stats.maxFlightId.value(), result.nextFlightId, stats.openTails);
    }
    return result;
}

} // namespace flight_seg
