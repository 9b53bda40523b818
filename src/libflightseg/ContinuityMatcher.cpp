/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <unordered_map>
#include <utility>

#include "ContinuityMatcher.hpp"
#include "Logging.hpp"

namespace flight_seg {

namespace {

struct FirstCandidate {
    CandidateId candidateId{0};
    Timestamp firstTimestamp{0};
};

} // namespace

ContinuityMatcher::ContinuityMatcher(const SegmentationConfig &config)
    : m_lookbackMs(config.lookbackHorizonMs()), m_continuationLimitMs(config.continuationLimitMs())
{
}

ContinuityMatcher::Result ContinuityMatcher::match(std::vector<FlightRecord> records,
                                                   const FlightTailState &previous) const
{
    Result result;
    if (records.empty()) {
        return result;
    }
    if (previous.empty()) {
        result.fresh = std::move(records);
        return result;
    }

    // Earliest candidate per OD key. Records are in (aircraft, time) order,
    // so the first record seen for a key starts that key's first candidate.
    std::unordered_map<OdKey, FirstCandidate, OdKeyHash> firstByKey;
    Timestamp chunkStart = records.front().position.timestamp;
    for (const auto &record : records) {
        chunkStart = std::min(chunkStart, record.position.timestamp);
        firstByKey.emplace(OdKey::of(record.position),
                           FirstCandidate{record.candidateId, record.position.timestamp});
    }

    std::unordered_map<CandidateId, FlightId> continuedCandidates;
    for (const auto &[key, first] : firstByKey) {
        if (first.firstTimestamp > chunkStart + m_lookbackMs) {
            continue;
        }
        const FlightTail *tail = previous.find(key);
        if (tail == nullptr) {
            continue;
        }
        Timestamp delay = first.firstTimestamp - tail->lastTimestamp;
        if (delay > m_continuationLimitMs) {
            FLIGHTSEG_LOG_TRACE("flight {} ({}) not continued: next record {} ms after its last", tail->flightId,
                                key.aircraftId, delay);
            continue;
        }
        continuedCandidates.emplace(first.candidateId, tail->flightId);
    }
    result.flightsContinued = continuedCandidates.size();

    for (auto &record : records) {
        auto it = continuedCandidates.find(record.candidateId);
        if (it != continuedCandidates.end()) {
            record.flightId = it->second;
            result.continued.push_back(std::move(record));
        } else {
            result.fresh.push_back(std::move(record));
        }
    }

    FLIGHTSEG_LOG_DEBUG("continuity: {} flights continued ({} records), {} records start new flights",
                        result.flightsContinued, result.continued.size(), result.fresh.size());
    return result;
}

} // namespace flight_seg
