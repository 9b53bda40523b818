/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Per-flight summary accumulated over every chunk of a run.
 *
 * One row per flight id: aircraft, route, first and last message time and
 * message count. Flights that continue across chunks are merged into a
 * single row.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

struct FlightInfo {
    FlightId flightId{0};
    std::string aircraftId;
    std::string origin;
    std::string destination;
    Timestamp firstMessage{0};
    Timestamp lastMessage{0};
    std::size_t messageCount{0};
};

class FlightSummary
{
  public:
    FlightSummary() = default;

    /// Fold labelled records into the summary. Records without an id are ignored.
    void add(const std::vector<FlightRecord> &records);

    [[nodiscard]] std::size_t size() const { return m_flights.size(); }
    [[nodiscard]] bool empty() const { return m_flights.empty(); }
    [[nodiscard]] const FlightInfo *find(FlightId flightId) const;

    /// Rows ordered by flight id
    [[nodiscard]] std::vector<FlightInfo> flights() const;

    void write(std::ostream &outStream) const;

    /// @throws std::runtime_error if the file can't be written
    void writeFile(const std::filesystem::path &path) const;

  private:
    std::map<FlightId, FlightInfo> m_flights;
};

} // namespace flight_seg
