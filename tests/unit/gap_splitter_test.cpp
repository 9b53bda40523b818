/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * Unit tests for splitting flights at hard gaps
 */

#include <gtest/gtest.h>
#include <GapSplitter.hpp>
#include <vector>

#include "TestHelpers.hpp"

using namespace flight_seg;
using namespace flight_seg::test;

namespace {

std::vector<FlightRecord> flight(const std::string &aircraft, FlightId id, const std::vector<Timestamp> &times) {
    std::vector<FlightRecord> records;
    for (auto ts : times) {
        FlightRecord record(makeRecord(aircraft, ts, std::string("EGLL"), std::string("EGPH")));
        record.flightId = id;
        records.push_back(record);
    }
    return records;
}

void append(std::vector<FlightRecord> &target, const std::vector<FlightRecord> &more) {
    target.insert(target.end(), more.begin(), more.end());
}

}  // anonymous namespace

class GapSplitterTest : public ::testing::Test {
protected:
    GapSplitter splitter{hours(6)};
    Timestamp t0 = baseTime();
};

TEST_F(GapSplitterTest, NoGapNoSplit) {
    auto records = flight("X", 0, {t0, t0 + minutes(1), t0 + hours(6)});
    EXPECT_EQ(0u, splitter.splitNewFlights(records));
    EXPECT_EQ(1u, flightIds(records).size());
}

TEST_F(GapSplitterTest, SplitsAtHardGap) {
    auto records = flight("X", 0, {t0, t0 + minutes(1), t0 + minutes(2), t0 + hours(8), t0 + hours(8) + minutes(1),
                                   t0 + hours(8) + minutes(2)});
    EXPECT_EQ(1u, splitter.countGaps(records));
    EXPECT_EQ(1u, splitter.splitNewFlights(records));

    EXPECT_EQ(0, records[2].flightId.value());
    EXPECT_EQ(1, records[3].flightId.value());
    EXPECT_EQ(1, records[5].flightId.value());
    EXPECT_EQ(0u, splitter.countGaps(records));
}

TEST_F(GapSplitterTest, CumulativeShiftKeepsIdsUnique) {
    // flights 10 and 11; 10 has two gaps so 11 moves up by two
    auto records = flight("A", 10, {t0, t0 + hours(7), t0 + hours(14)});
    append(records, flight("B", 11, {t0, t0 + minutes(5)}));

    EXPECT_EQ(2u, splitter.splitNewFlights(records));
    EXPECT_EQ(10, records[0].flightId.value());
    EXPECT_EQ(11, records[1].flightId.value());
    EXPECT_EQ(12, records[2].flightId.value());
    EXPECT_EQ(13, records[3].flightId.value());
    EXPECT_EQ(13, records[4].flightId.value());
}

TEST_F(GapSplitterTest, GapBetweenDifferentFlightsIsNotASplit) {
    auto records = flight("A", 0, {t0, t0 + minutes(1)});
    append(records, flight("A", 1, {t0 + hours(10), t0 + hours(10) + minutes(1)}));

    EXPECT_EQ(0u, splitter.countGaps(records));
    EXPECT_EQ(0u, splitter.splitNewFlights(records));
    EXPECT_EQ(1, records[3].flightId.value());
}

TEST_F(GapSplitterTest, ContinuedFlightsTakeFreshIds) {
    auto records = flight("A", 3, {t0, t0 + hours(7)});
    append(records, flight("B", 4, {t0, t0 + hours(7), t0 + hours(14)}));

    FlightId nextFree = 20;
    EXPECT_EQ(3u, splitter.splitContinuedFlights(records, nextFree));
    EXPECT_EQ(23, nextFree);
    EXPECT_EQ(3, records[0].flightId.value());
    EXPECT_EQ(20, records[1].flightId.value());
    EXPECT_EQ(4, records[2].flightId.value());
    EXPECT_EQ(21, records[3].flightId.value());
    EXPECT_EQ(22, records[4].flightId.value());
    EXPECT_EQ(0u, splitter.countGaps(records));
}

TEST_F(GapSplitterTest, ContinuedWithoutGapUnchanged) {
    auto records = flight("A", 3, {t0, t0 + hours(1)});
    FlightId nextFree = 20;
    EXPECT_EQ(0u, splitter.splitContinuedFlights(records, nextFree));
    EXPECT_EQ(20, nextFree);
    EXPECT_EQ(3, records[1].flightId.value());
}

TEST_F(GapSplitterTest, EmptyInput) {
    std::vector<FlightRecord> records;
    FlightId nextFree = 0;
    EXPECT_EQ(0u, splitter.splitNewFlights(records));
    EXPECT_EQ(0u, splitter.splitContinuedFlights(records, nextFree));
}
