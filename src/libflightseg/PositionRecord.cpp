/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Classes for representing aircraft position reports and the
 * flights they are segmented into.
 *
 */

#include <algorithm>
#include <stdexcept>
#include <tuple>

#include "PositionRecord.hpp"
#include "Timestamp.hpp"

namespace flight_seg {

void PositionRecord::dump(std::ostream &outStream) const
{
    outStream << "Position:" << "\n    aircraft: " << aircraftId << "\n    time: " << formatTimestamp(timestamp)
              << "\n    lat/lng: " << latitude << ", " << longitude
              << "\n    origin: " << origin.value_or("(none)") << "\n    destination: " << destination.value_or("(none)")
              << "\n    passthrough fields: " << passthrough.size() << "\n";
}

bool OdKey::operator<(const OdKey &other) const
{
    return std::tie(aircraftId, origin, destination) < std::tie(other.aircraftId, other.origin, other.destination);
}

OdKey OdKey::of(const PositionRecord &record)
{
    if (!record.hasRoute()) {
        throw std::invalid_argument{"OD key requested for aircraft " + record.aircraftId +
                                    " record without origin and destination"};
    }
    return OdKey{record.aircraftId, *record.origin, *record.destination};
}

std::size_t OdKeyHash::operator()(const OdKey &key) const
{
    std::hash<std::string> hasher;
    std::size_t seed = hasher(key.aircraftId);
    // boost::hash_combine
    seed ^= hasher(key.origin) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= hasher(key.destination) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

bool aircraftTimeLess(const PositionRecord &lhs, const PositionRecord &rhs)
{
    if (lhs.aircraftId != rhs.aircraftId) {
        return lhs.aircraftId < rhs.aircraftId;
    }
    return lhs.timestamp < rhs.timestamp;
}

void sortByAircraftAndTime(std::vector<PositionRecord> &records)
{
    std::stable_sort(records.begin(), records.end(), aircraftTimeLess);
}

void sortByAircraftAndTime(std::vector<FlightRecord> &records)
{
    std::stable_sort(records.begin(), records.end(),
                     [](const FlightRecord &lhs, const FlightRecord &rhs) {
                         return aircraftTimeLess(lhs.position, rhs.position);
                     });
}

} // namespace flight_seg
