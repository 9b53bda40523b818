/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief The flights still open at the end of a chunk.
 *
 * This is the only thing handed from one chunk to the next. A snapshot is
 * never modified after it is built; processing a chunk produces a new one.
 */

#pragma once

#include <cstddef>
#include <iostream>
#include <optional>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

struct FlightTail {
    OdKey key;
    FlightId flightId{0};
    Timestamp lastTimestamp{0};
};

class FlightTailState
{
  public:
    FlightTailState() = default;
    virtual ~FlightTailState() = default;

    FlightTailState(const FlightTailState &) = default;
    FlightTailState &operator=(const FlightTailState &) = default;
    FlightTailState(FlightTailState &&) = default;
    FlightTailState &operator=(FlightTailState &&) = default;

    /**
     * Build the snapshot from one chunk's labelled output: the last timestamp
     * of every (flight, OD key), keeping only flights whose last record lies
     * within the lookback horizon of the chunk's latest timestamp.
     */
    [[nodiscard]] static FlightTailState fromChunkOutput(const std::vector<FlightRecord> &records,
                                                         Timestamp lookbackHorizonMs);

    /**
     * Build a snapshot from explicit tails.
     *
     * At most one tail may be open per OD key. Where several are given, only
     * the most recent survives (latest last timestamp, then highest flight
     * id) and the others are counted in collapsedTails().
     */
    [[nodiscard]] static FlightTailState fromTails(std::vector<FlightTail> tails);

    [[nodiscard]] bool empty() const { return m_tails.empty(); }
    [[nodiscard]] std::size_t size() const { return m_tails.size(); }

    /// The open tail for this OD key, or nullptr
    [[nodiscard]] const FlightTail *find(const OdKey &key) const;

    [[nodiscard]] std::optional<FlightId> maxFlightId() const;

    /// Tails discarded while enforcing one open tail per OD key
    [[nodiscard]] std::size_t collapsedTails() const { return m_collapsedTails; }

    /// Collapsed tails whose last timestamp equalled the kept one's
    [[nodiscard]] std::size_t tiedTails() const { return m_tiedTails; }

    /// Sorted by OD key
    [[nodiscard]] const std::vector<FlightTail> &tails() const { return m_tails; }

    void dump(std::ostream &outStream) const;

  private:
    std::vector<FlightTail> m_tails;
    std::size_t m_collapsedTails{0};
    std::size_t m_tiedTails{0};
};

} // namespace flight_seg
