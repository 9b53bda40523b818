/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "Csv.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "RouteScope.hpp"

namespace flight_seg {

RouteScope::RouteScope(std::unordered_set<std::string> airports) : m_admitAll(false), m_airports(std::move(airports))
{
}

RouteScope RouteScope::fromAirportsCsv(std::istream &stream, const std::string &country)
{
    std::string line;
    if (!csv::readLine(stream, line)) {
        throw SchemaError{"airports table is empty"};
    }
    auto header = csv::splitLine(line);
    auto icaoCol = csv::findColumn(header, COL_AIRPORT_ICAO);
    auto countryCol = csv::findColumn(header, COL_AIRPORT_COUNTRY);
    if (!icaoCol.has_value() || !countryCol.has_value()) {
        std::stringstream msg;
        msg << "airports table needs columns " << COL_AIRPORT_ICAO << " and " << COL_AIRPORT_COUNTRY;
        throw SchemaError{msg.str()};
    }

    std::unordered_set<std::string> airports;
    int lineno = 1;
    std::size_t skipped = 0;
    while (csv::readLine(stream, line)) {
        ++lineno;
        if (line.empty()) {
            continue;
        }
        std::vector<std::string> fields;
        try {
            fields = csv::splitLine(line);
        } catch (const std::invalid_argument &) {
            ++skipped;
            continue;
        }
        if (fields.size() != header.size()) {
            ++skipped;
            continue;
        }
        const auto &icao = fields[icaoCol.value()];
        if (!icao.empty() && fields[countryCol.value()] == country) {
            airports.insert(icao);
        }
    }

    if (skipped > 0) {
        FLIGHTSEG_LOG_WARN("airports table: skipped {} malformed rows", skipped);
    }
    FLIGHTSEG_LOG_INFO("route scope: {} airports in {}", airports.size(), country);
    return RouteScope(std::move(airports));
}

RouteScope RouteScope::fromAirportsFile(const std::filesystem::path &path, const std::string &country)
{
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw std::runtime_error{"airports file not found: " + path.string()};
    }
    return fromAirportsCsv(stream, country);
}

bool RouteScope::admits(const PositionRecord &record) const
{
    if (m_admitAll) {
        return true;
    }
    return (record.origin.has_value() && m_airports.count(record.origin.value()) > 0) ||
           (record.destination.has_value() && m_airports.count(record.destination.value()) > 0);
}

std::size_t RouteScope::apply(std::vector<FlightRecord> &records) const
{
    if (m_admitAll) {
        return 0;
    }
    auto before = records.size();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [this](const FlightRecord &record) { return !admits(record.position); }),
                  records.end());
    return before - records.size();
}

} // namespace flight_seg
