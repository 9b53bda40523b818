/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include "GapSplitter.hpp"
#include "Logging.hpp"

namespace flight_seg {

// Records of one flight are contiguous in (aircraft, time) order, so the
// predecessor within the flight is the previous record whenever the ids agree.
bool GapSplitter::isGap(const FlightRecord &previous, const FlightRecord &current) const
{
    return previous.flightId == current.flightId &&
           current.position.timestamp - previous.position.timestamp > m_hardGapMs;
}

std::size_t GapSplitter::splitNewFlights(std::vector<FlightRecord> &records) const
{
    FlightId increment = 0;
    std::optional<FlightId> previousOriginalId;
    Timestamp previousTimestamp = 0;

    for (auto &record : records) {
        if (!record.flightId.has_value()) {
            continue;
        }
        FlightId originalId = record.flightId.value();
        if (previousOriginalId == originalId && record.position.timestamp - previousTimestamp > m_hardGapMs) {
            ++increment;
        }
        previousOriginalId = originalId;
        previousTimestamp = record.position.timestamp;
        record.flightId = originalId + increment;
    }

    if (increment > 0) {
        FLIGHTSEG_LOG_DEBUG("gap split: {} new flights split at gaps", increment);
    }
    return static_cast<std::size_t>(increment);
}

std::size_t GapSplitter::splitContinuedFlights(std::vector<FlightRecord> &records, FlightId &nextFreeId) const
{
    std::size_t splits = 0;
    std::optional<FlightId> previousOriginalId;
    Timestamp previousTimestamp = 0;
    FlightId currentId = 0;

    for (auto &record : records) {
        if (!record.flightId.has_value()) {
            continue;
        }
        FlightId originalId = record.flightId.value();
        if (previousOriginalId != originalId) {
            currentId = originalId;
        } else if (record.position.timestamp - previousTimestamp > m_hardGapMs) {
            currentId = nextFreeId++;
            ++splits;
        }
        previousOriginalId = originalId;
        previousTimestamp = record.position.timestamp;
        record.flightId = currentId;
    }

    if (splits > 0) {
        FLIGHTSEG_LOG_DEBUG("gap split: {} continued flights split at gaps", splits);
    }
    return splits;
}

std::size_t GapSplitter::countGaps(const std::vector<FlightRecord> &records) const
{
    std::size_t gaps = 0;
    for (std::size_t i = 1; i < records.size(); ++i) {
        if (records[i].flightId.has_value() && isGap(records[i - 1], records[i])) {
            ++gaps;
        }
    }
    return gaps;
}

} // namespace flight_seg
