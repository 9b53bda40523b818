/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Classes for representing aircraft position reports and the
 * flights they are segmented into.
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "SegmentationConstants.hpp"

namespace flight_seg {

using FlightId = std::int64_t;
using CandidateId = std::size_t;

/**
 * One position report for one aircraft at one instant, as ingested.
 *
 * Only the track repairer ever changes a record, and then only to fill in a
 * missing origin or destination.
 */
struct PositionRecord {
    Timestamp timestamp{0};
    std::string aircraftId; // ICAO24 address
    double latitude{0.0};
    double longitude{0.0};
    std::optional<std::string> origin;      // departure airport ICAO
    std::optional<std::string> destination; // arrival airport ICAO

    // Remaining columns of the source file, in the order of the batch's
    // passthrough schema. Never interpreted.
    std::vector<std::string> passthrough;

    [[nodiscard]] bool hasRoute() const { return origin.has_value() && destination.has_value(); }

    void dump(std::ostream &outStream) const;
};

/**
 * (aircraft, origin, destination). Two records with the same key belong to
 * the same journey as far as the metadata is concerned.
 */
struct OdKey {
    std::string aircraftId;
    std::string origin;
    std::string destination;

    bool operator==(const OdKey &other) const
    {
        return aircraftId == other.aircraftId && origin == other.origin && destination == other.destination;
    }
    bool operator!=(const OdKey &other) const { return !(*this == other); }
    bool operator<(const OdKey &other) const;

    /// Throws std::invalid_argument if the record's route is incomplete.
    static OdKey of(const PositionRecord &record);
};

struct OdKeyHash {
    std::size_t operator()(const OdKey &key) const;
};

/**
 * A position record travelling through the segmentation stages, together
 * with its working labels.
 */
struct FlightRecord {
    PositionRecord position;

    // Run id from the candidate grouper; only meaningful inside one chunk
    CandidateId candidateId{0};

    // Final id, assigned by the continuity matcher or the noise filter
    std::optional<FlightId> flightId;

    FlightRecord() = default;
    explicit FlightRecord(PositionRecord pos) : position(std::move(pos)) {}
};

/// Ordering used by every stage: aircraft first, then time
[[nodiscard]] bool aircraftTimeLess(const PositionRecord &lhs, const PositionRecord &rhs);

/// Stable sort by (aircraft, timestamp)
void sortByAircraftAndTime(std::vector<PositionRecord> &records);
void sortByAircraftAndTime(std::vector<FlightRecord> &records);

} // namespace flight_seg
