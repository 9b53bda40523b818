/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <optional>
#include <unordered_map>
#include <utility>

#include "Logging.hpp"
#include "NoiseFilter.hpp"

namespace flight_seg {

namespace {

struct LabelledCandidate {
    OdKey key;
    FlightId flightId{0};
    bool continued{false};
};

} // namespace

std::vector<FlightRecord> NoiseFilter::filter(std::vector<FlightRecord> records, FlightId firstFlightId)
{
    std::vector<FlightRecord> continued;
    return filter(std::move(records), firstFlightId, continued);
}

std::vector<FlightRecord> NoiseFilter::filter(std::vector<FlightRecord> records, FlightId firstFlightId,
                                              std::vector<FlightRecord> &continued)
{
    m_stats = Stats{};
    if (records.empty()) {
        return records;
    }

    std::unordered_map<CandidateId, std::size_t> counts;
    for (const auto &record : records) {
        ++counts[record.candidateId];
    }
    m_stats.candidatesIn = counts.size();

    std::vector<FlightRecord> survivors;
    survivors.reserve(records.size());
    for (auto &record : records) {
        if (counts[record.candidateId] > m_minPoints) {
            survivors.push_back(std::move(record));
        } else {
            ++m_stats.recordsDropped;
        }
    }
    for (const auto &[candidate, count] : counts) {
        if (count <= m_minPoints) {
            ++m_stats.candidatesDropped;
        }
    }

    // Candidate ids are dense over the whole chunk. One that is missing from
    // counts went to the continued stream, so it is a real separator.
    auto isNoise = [&counts, this](CandidateId candidate) {
        auto it = counts.find(candidate);
        return it != counts.end() && it->second <= m_minPoints;
    };

    std::unordered_map<CandidateId, LabelledCandidate> labelled;
    for (const auto &record : continued) {
        labelled.emplace(record.candidateId, LabelledCandidate{OdKey::of(record.position), record.flightId.value(), true});
    }

    std::vector<FlightRecord> fresh;
    fresh.reserve(survivors.size());
    FlightId nextId = firstFlightId;
    std::optional<CandidateId> currentCandidate;
    FlightId currentId = 0;
    bool rejoined = false;
    for (auto &record : survivors) {
        if (currentCandidate != record.candidateId) {
            currentCandidate = record.candidateId;
            OdKey key = OdKey::of(record.position);

            std::optional<CandidateId> predecessor;
            for (CandidateId candidate = record.candidateId; candidate > 0;) {
                --candidate;
                if (!isNoise(candidate)) {
                    predecessor = candidate;
                    break;
                }
            }

            auto it = predecessor.has_value() ? labelled.find(predecessor.value()) : labelled.end();
            if (it != labelled.end() && it->second.key == key) {
                currentId = it->second.flightId;
                rejoined = it->second.continued;
            } else {
                currentId = nextId++;
                rejoined = false;
            }
            labelled.emplace(record.candidateId, LabelledCandidate{std::move(key), currentId, rejoined});
        }

        record.flightId = currentId;
        if (rejoined) {
            ++m_stats.recordsRejoined;
            continued.push_back(std::move(record));
        } else {
            fresh.push_back(std::move(record));
        }
    }
    m_stats.flightsOut = static_cast<std::size_t>(nextId - firstFlightId);

    FLIGHTSEG_LOG_DEBUG("noise filter: dropped {} of {} candidates ({} records), {} new flights from id {}, {} "
                        "records rejoined continued flights",
                        m_stats.candidatesDropped, m_stats.candidatesIn, m_stats.recordsDropped, m_stats.flightsOut,
                        firstFlightId, m_stats.recordsRejoined);
    return fresh;
}

} // namespace flight_seg
