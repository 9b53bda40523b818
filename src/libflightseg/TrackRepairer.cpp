/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <utility>

#include "Logging.hpp"
#include "TrackRepairer.hpp"

namespace flight_seg {

// Forward fill, then backward fill the leading edge. Returns the number of
// values filled.
std::size_t TrackRepairer::fillTrack(std::vector<PositionRecord> &records, std::size_t begin, std::size_t end,
                                     Field field)
{
    std::size_t filled = 0;
    const std::optional<std::string> *last = nullptr;
    std::size_t firstKnown = end;

    for (std::size_t i = begin; i < end; ++i) {
        auto &value = records[i].*field;
        if (value.has_value()) {
            last = &value;
            if (firstKnown == end) {
                firstKnown = i;
            }
        } else if (last != nullptr) {
            value = *last;
            ++filled;
        }
    }

    if (firstKnown == end) {
        return filled;
    }
    for (std::size_t i = begin; i < firstKnown; ++i) {
        records[i].*field = records[firstKnown].*field;
        ++filled;
    }
    return filled;
}

std::vector<PositionRecord> TrackRepairer::repair(std::vector<PositionRecord> records)
{
    m_stats = Stats{};
    m_stats.recordsIn = records.size();
    if (records.empty()) {
        return records;
    }

    sortByAircraftAndTime(records);

    std::vector<PositionRecord> repaired;
    repaired.reserve(records.size());

    std::size_t begin = 0;
    while (begin < records.size()) {
        std::size_t end = begin;
        bool anyOrigin = false;
        bool anyDestination = false;
        while (end < records.size() && records[end].aircraftId == records[begin].aircraftId) {
            anyOrigin = anyOrigin || records[end].origin.has_value();
            anyDestination = anyDestination || records[end].destination.has_value();
            ++end;
        }

        if (anyOrigin && anyDestination) {
            m_stats.originsFilled += fillTrack(records, begin, end, &PositionRecord::origin);
            m_stats.destinationsFilled += fillTrack(records, begin, end, &PositionRecord::destination);
            for (std::size_t i = begin; i < end; ++i) {
                repaired.push_back(std::move(records[i]));
            }
        } else {
            FLIGHTSEG_LOG_TRACE("dropping aircraft {}: no {} in chunk ({} records)", records[begin].aircraftId,
                                anyOrigin ? "destination" : "origin", end - begin);
            ++m_stats.aircraftDropped;
        }
        begin = end;
    }

    m_stats.recordsOut = repaired.size();
    FLIGHTSEG_LOG_DEBUG("track repair: records {} -> {}, aircraft dropped={}, filled origin={} destination={}",
                        m_stats.recordsIn, m_stats.recordsOut, m_stats.aircraftDropped, m_stats.originsFilled,
                        m_stats.destinationsFilled);
    return repaired;
}

} // namespace flight_seg
