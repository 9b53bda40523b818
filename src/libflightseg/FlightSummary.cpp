/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include "Csv.hpp"
#include "FlightSummary.hpp"
#include "Timestamp.hpp"

namespace flight_seg {

void FlightSummary::add(const std::vector<FlightRecord> &records)
{
    for (const auto &record : records) {
        if (!record.flightId.has_value()) {
            continue;
        }
        const auto &pos = record.position;
        auto [it, inserted] = m_flights.try_emplace(record.flightId.value());
        auto &info = it->second;
        if (inserted) {
            info.flightId = record.flightId.value();
            info.aircraftId = pos.aircraftId;
            info.origin = pos.origin.value_or("");
            info.destination = pos.destination.value_or("");
            info.firstMessage = pos.timestamp;
            info.lastMessage = pos.timestamp;
        } else {
            info.firstMessage = std::min(info.firstMessage, pos.timestamp);
            info.lastMessage = std::max(info.lastMessage, pos.timestamp);
        }
        ++info.messageCount;
    }
}

const FlightInfo *FlightSummary::find(FlightId flightId) const
{
    auto it = m_flights.find(flightId);
    return it == m_flights.end() ? nullptr : &it->second;
}

std::vector<FlightInfo> FlightSummary::flights() const
{
    std::vector<FlightInfo> rows;
    rows.reserve(m_flights.size());
    for (const auto &entry : m_flights) {
        rows.push_back(entry.second);
    }
    return rows;
}

void FlightSummary::write(std::ostream &outStream) const
{
    outStream << csv::joinLine({COL_FLIGHT_ID, COL_AIRCRAFT, COL_ORIGIN, COL_DESTINATION, COL_FIRST_MESSAGE,
                                COL_LAST_MESSAGE, COL_MESSAGE_COUNT})
              << '\n';
    for (const auto &[id, info] : m_flights) {
        outStream << csv::joinLine({std::to_string(id), info.aircraftId, info.origin, info.destination,
                                    formatTimestamp(info.firstMessage), formatTimestamp(info.lastMessage),
                                    std::to_string(info.messageCount)})
                  << '\n';
    }
}

void FlightSummary::writeFile(const std::filesystem::path &path) const
{
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error{"cannot write flight info file " + path.string()};
    }
    write(out);
    if (!out) {
        throw std::runtime_error{"write failed for " + path.string()};
    }
}

} // namespace flight_seg
