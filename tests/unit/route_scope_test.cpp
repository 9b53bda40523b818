/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * Unit tests for the regional output filter
 */

#include <gtest/gtest.h>
#include <Errors.hpp>
#include <RouteScope.hpp>
#include <sstream>
#include <stdexcept>

#include "TestHelpers.hpp"

using namespace flight_seg;
using namespace flight_seg::test;

namespace {

const std::string AIRPORTS = "id,icao,name,iso_country\n"
                             "1,EGLL,\"London Heathrow\",GB\n"
                             "2,EGPH,Edinburgh,GB\n"
                             "3,LFPG,\"Paris, Charles de Gaulle\",FR\n"
                             "4,,No code,GB\n"
                             "5,EIDW,Dublin,IE\n";

RouteScope scopeFor(const std::string &country) {
    std::istringstream in(AIRPORTS);
    return RouteScope::fromAirportsCsv(in, country);
}

}  // anonymous namespace

TEST(RouteScopeTest, DefaultAdmitsEverything) {
    RouteScope scope;
    EXPECT_TRUE(scope.admitsAll());
    EXPECT_TRUE(scope.admits(makeRecord("X", baseTime(), std::string("KJFK"), std::string("KLAX"))));
    EXPECT_TRUE(scope.admits(makeRecord("X", baseTime())));
}

TEST(RouteScopeTest, LoadsAirportsOfOneCountry) {
    auto scope = scopeFor("GB");
    EXPECT_FALSE(scope.admitsAll());
    EXPECT_EQ(2u, scope.airportCount());
}

TEST(RouteScopeTest, OriginOrDestinationInScope) {
    auto scope = scopeFor("GB");
    Timestamp t0 = baseTime();
    EXPECT_TRUE(scope.admits(makeRecord("X", t0, std::string("EGLL"), std::string("LFPG"))));
    EXPECT_TRUE(scope.admits(makeRecord("X", t0, std::string("LFPG"), std::string("EGPH"))));
    EXPECT_FALSE(scope.admits(makeRecord("X", t0, std::string("LFPG"), std::string("EIDW"))));
    EXPECT_FALSE(scope.admits(makeRecord("X", t0)));
}

TEST(RouteScopeTest, OtherCountry) {
    auto scope = scopeFor("FR");
    EXPECT_EQ(1u, scope.airportCount());
    EXPECT_TRUE(scope.admits(makeRecord("X", baseTime(), std::string("LFPG"), std::string("EIDW"))));
}

TEST(RouteScopeTest, ApplyRemovesOutOfScopeRecords) {
    auto scope = scopeFor("GB");
    Timestamp t0 = baseTime();
    auto records = toFlightRecords(makeTrack("X", "EGLL", "EGPH", t0, 3));
    auto foreign = toFlightRecords(makeTrack("Y", "LFPG", "EIDW", t0, 2));
    records.insert(records.end(), foreign.begin(), foreign.end());

    EXPECT_EQ(2u, scope.apply(records));
    ASSERT_EQ(3u, records.size());
    EXPECT_EQ("X", records.back().position.aircraftId);
}

TEST(RouteScopeTest, MissingColumnsAreSchemaError) {
    std::istringstream in("ident,country\nEGLL,GB\n");
    EXPECT_THROW(RouteScope::fromAirportsCsv(in, "GB"), SchemaError);

    std::istringstream empty("");
    EXPECT_THROW(RouteScope::fromAirportsCsv(empty, "GB"), SchemaError);
}

TEST(RouteScopeTest, MissingFileThrows) {
    EXPECT_THROW(RouteScope::fromAirportsFile("/nonexistent/flightseg/airports.csv", "GB"), std::runtime_error);
}
