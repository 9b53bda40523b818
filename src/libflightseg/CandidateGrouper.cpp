/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <utility>

#include "CandidateGrouper.hpp"
#include "Logging.hpp"

namespace flight_seg {

std::size_t CandidateGrouper::group(std::vector<FlightRecord> &records) const
{
    if (records.empty()) {
        return 0;
    }

    sortByAircraftAndTime(records);

    CandidateId current = 0;
    OdKey previous = OdKey::of(records.front().position);
    for (auto &record : records) {
        OdKey key = OdKey::of(record.position);
        if (key != previous) {
            ++current;
            previous = std::move(key);
        }
        record.candidateId = current;
    }

    std::size_t candidates = current + 1;
    FLIGHTSEG_LOG_DEBUG("candidate grouping: {} records in {} candidates", records.size(), candidates);
    return candidates;
}

std::vector<FlightRecord> CandidateGrouper::group(std::vector<PositionRecord> positions) const
{
    std::vector<FlightRecord> records;
    records.reserve(positions.size());
    for (auto &position : positions) {
        records.emplace_back(std::move(position));
    }
    group(records);
    return records;
}

} // namespace flight_seg
