/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <map>
#include <utility>

#include "FlightTailState.hpp"
#include "Logging.hpp"
#include "Timestamp.hpp"

namespace flight_seg {

FlightTailState FlightTailState::fromChunkOutput(const std::vector<FlightRecord> &records,
                                                 Timestamp lookbackHorizonMs)
{
    if (records.empty()) {
        return FlightTailState{};
    }

    Timestamp maxTimestamp = records.front().position.timestamp;
    for (const auto &record : records) {
        maxTimestamp = std::max(maxTimestamp, record.position.timestamp);
    }
    const Timestamp threshold = maxTimestamp - lookbackHorizonMs;

    // keyed on (flight, OD key); a flight only ever has one key, but the
    // grouping mirrors how the tail is defined
    std::map<std::pair<FlightId, OdKey>, Timestamp> lastSeen;
    for (const auto &record : records) {
        if (!record.flightId.has_value()) {
            continue;
        }
        auto key = std::make_pair(record.flightId.value(), OdKey::of(record.position));
        auto it = lastSeen.find(key);
        if (it == lastSeen.end()) {
            lastSeen.emplace(std::move(key), record.position.timestamp);
        } else {
            it->second = std::max(it->second, record.position.timestamp);
        }
    }

    std::vector<FlightTail> tails;
    for (const auto &[flightAndKey, last] : lastSeen) {
        if (last >= threshold) {
            tails.push_back(FlightTail{flightAndKey.second, flightAndKey.first, last});
        }
    }
    return fromTails(std::move(tails));
}

FlightTailState FlightTailState::fromTails(std::vector<FlightTail> tails)
{
    // most recent first within each key, so the first of a run is the keeper
    std::sort(tails.begin(), tails.end(), [](const FlightTail &lhs, const FlightTail &rhs) {
        if (lhs.key != rhs.key) {
            return lhs.key < rhs.key;
        }
        if (lhs.lastTimestamp != rhs.lastTimestamp) {
            return lhs.lastTimestamp > rhs.lastTimestamp;
        }
        return lhs.flightId > rhs.flightId;
    });

    FlightTailState state;
    for (auto &tail : tails) {
        if (!state.m_tails.empty() && state.m_tails.back().key == tail.key) {
            const FlightTail &keeper = state.m_tails.back();
            FLIGHTSEG_LOG_DEBUG("collapsing open tail of flight {} into flight {} ({} {}->{})", tail.flightId,
                                keeper.flightId, tail.key.aircraftId, tail.key.origin, tail.key.destination);
            if (keeper.lastTimestamp == tail.lastTimestamp) {
                ++state.m_tiedTails;
            }
            ++state.m_collapsedTails;
            continue;
        }
        state.m_tails.push_back(std::move(tail));
    }

    // An earlier leg on the same route is ordinary traffic; only a tie in
    // the last timestamp leaves the continuation ambiguous.
    if (state.m_tiedTails > 0) {
        FLIGHTSEG_LOG_WARN("{} open flights tied with another on aircraft/route and last timestamp; kept the "
                           "highest flight id",
                           state.m_tiedTails);
    } else if (state.m_collapsedTails > 0) {
        FLIGHTSEG_LOG_DEBUG("{} earlier open flights closed by a more recent one on the same aircraft/route",
                            state.m_collapsedTails);
    }
    return state;
}

const FlightTail *FlightTailState::find(const OdKey &key) const
{
    auto it = std::lower_bound(m_tails.begin(), m_tails.end(), key,
                               [](const FlightTail &tail, const OdKey &k) { return tail.key < k; });
    if (it == m_tails.end() || it->key != key) {
        return nullptr;
    }
    return &(*it);
}

std::optional<FlightId> FlightTailState::maxFlightId() const
{
    if (m_tails.empty()) {
        return std::nullopt;
    }
    auto it = std::max_element(m_tails.begin(), m_tails.end(), [](const FlightTail &lhs, const FlightTail &rhs) {
        return lhs.flightId < rhs.flightId;
    });
    return it->flightId;
}

void FlightTailState::dump(std::ostream &outStream) const
{
    outStream << "Open flights: " << m_tails.size() << " (collapsed " << m_collapsedTails << ")\n";
    for (const auto &tail : m_tails) {
        outStream << "    flight " << tail.flightId << ": " << tail.key.aircraftId << " " << tail.key.origin << "->"
                  << tail.key.destination << " last " << formatTimestamp(tail.lastTimestamp) << "\n";
    }
}

} // namespace flight_seg
