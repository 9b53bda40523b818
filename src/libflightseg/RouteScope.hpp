/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Decides which segmented records go to the output.
 *
 * A record is in scope when it departs from or arrives at one of a set of
 * airports, typically every airport of one country. The scope is applied
 * after segmentation; it never influences flight ids.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <unordered_set>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

class RouteScope
{
  public:
    /// A scope that admits every record
    RouteScope() = default;
    explicit RouteScope(std::unordered_set<std::string> airports);
    virtual ~RouteScope() = default;

    /**
     * Airports of one country from a CSV with "icao" and "iso_country"
     * columns.
     *
     * @throws SchemaError if either column is missing
     * @throws std::runtime_error if the file can't be opened
     */
    [[nodiscard]] static RouteScope fromAirportsFile(const std::filesystem::path &path, const std::string &country);
    [[nodiscard]] static RouteScope fromAirportsCsv(std::istream &stream, const std::string &country);

    [[nodiscard]] bool admitsAll() const { return m_admitAll; }
    [[nodiscard]] std::size_t airportCount() const { return m_airports.size(); }

    [[nodiscard]] bool admits(const PositionRecord &record) const;

    /// Keep only records in scope. Returns the number removed.
    std::size_t apply(std::vector<FlightRecord> &records) const;

  private:
    bool m_admitAll{true};
    std::unordered_set<std::string> m_airports;
};

} // namespace flight_seg
