/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * End-to-end tests for the chunk loop: files in, day partitions out
 */

#include <gtest/gtest.h>
#include <ChunkSequencer.hpp>
#include <Errors.hpp>
#include <algorithm>
#include <sstream>

#include "TestHelpers.hpp"

using namespace flight_seg;
using namespace flight_seg::test;

class ChunkSequencerTest : public ScratchDirTest {
protected:
    SegmentationConfig segmentation;
    PipelineConfig pipeline;
    Timestamp t0 = baseTime();
    std::vector<std::filesystem::path> files;

    void SetUp() override {
        ScratchDirTest::SetUp();
        pipeline.outputDir = (dir / "out").string();
        pipeline.chunkSizeFiles = 1;

        // X early in the day, Y late, Z on a French/Irish route
        std::vector<PositionRecord> first = makeTrack("X", "EGLL", "EGPH", t0, 5);
        appendTo(first, makeTrack("Y", "EGLL", "EGPH", t0 + hours(22), 7, minutes(10)));
        appendTo(first, makeTrack("Z", "LFPG", "EIDW", t0 + hours(10), 5));
        // Y picks up again in the next file
        std::vector<PositionRecord> second = makeTrack("Y", "EGLL", "EGPH", t0 + hours(23.5), 4);

        files.push_back(writeFile("positions_1.csv", positionCsv(first, true)));
        files.push_back(writeFile("positions_2.csv", positionCsv(second, true)));
    }

    std::vector<std::string> sortedRows(int ordinalDay) {
        auto lines = readLines(dir / "out" / ("flights_day_0" + std::to_string(ordinalDay) + ".csv"));
        std::sort(lines.begin() + 1, lines.end());
        return lines;
    }
};

TEST_F(ChunkSequencerTest, RunsEveryChunkAndWritesPartitions) {
    ChunkSequencer sequencer(segmentation, pipeline);
    auto summary = sequencer.run(files);

    EXPECT_EQ(2u, summary.chunks);
    EXPECT_EQ(2u, summary.files);
    EXPECT_EQ(21u, summary.recordsRead);
    EXPECT_EQ(21u, summary.recordsSegmented);
    EXPECT_EQ(21u, summary.recordsRouted);
    EXPECT_EQ(1u, summary.flightsContinued);
    EXPECT_EQ(3u, summary.newFlights);
    EXPECT_EQ(3, summary.nextFlightId);
    EXPECT_EQ(std::set<int>{61}, summary.partitions);

    auto lines = readLines(dir / "out" / "flights_day_061.csv");
    ASSERT_EQ(22u, lines.size());
    EXPECT_EQ("timestamp,icao_address,latitude,longitude,departure_airport_icao,arrival_airport_icao,callsign,"
              "flight_id",
              lines[0]);
    // chunk 2's rows come after chunk 1's and keep Y's id
    EXPECT_EQ("2024-03-01 23:30:00.000 UTC,Y,51.47,-0.4543,EGLL,EGPH,CSY,1", lines[18]);
}

TEST_F(ChunkSequencerTest, ChunkSizeDoesNotChangeFlights) {
    {
        ChunkSequencer sequencer(segmentation, pipeline);
        sequencer.run(files);
    }
    auto chunked = sortedRows(61);

    std::filesystem::remove_all(dir / "out");
    pipeline.chunkSizeFiles = 2;
    ChunkSequencer sequencer(segmentation, pipeline);
    auto summary = sequencer.run(files);
    EXPECT_EQ(1u, summary.chunks);

    EXPECT_EQ(chunked, sortedRows(61));
}

TEST_F(ChunkSequencerTest, ChunkSizeDoesNotChangeFlightsAcrossNoise) {
    // Y's flight is interrupted by a two-record blip on another route
    std::vector<PositionRecord> first = makeTrack("Y", "EGLL", "EGPH", t0, 5);
    std::vector<PositionRecord> second = makeTrack("Y", "EGLL", "EGPH", t0 + minutes(5), 3);
    appendTo(second, makeTrack("Y", "EGLL", "EGKK", t0 + minutes(8), 2));
    appendTo(second, makeTrack("Y", "EGLL", "EGPH", t0 + minutes(10), 5));
    std::vector<std::filesystem::path> blipFiles{writeFile("blip_1.csv", positionCsv(first, true)),
                                                 writeFile("blip_2.csv", positionCsv(second, true))};

    {
        ChunkSequencer sequencer(segmentation, pipeline);
        auto summary = sequencer.run(blipFiles);
        EXPECT_EQ(2u, summary.chunks);
        EXPECT_EQ(1, summary.nextFlightId);
    }
    auto chunked = sortedRows(61);
    ASSERT_EQ(14u, chunked.size());
    for (std::size_t i = 1; i < chunked.size(); ++i) {
        EXPECT_EQ(",0", chunked[i].substr(chunked[i].size() - 2)) << chunked[i];
    }

    std::filesystem::remove_all(dir / "out");
    pipeline.chunkSizeFiles = 2;
    ChunkSequencer sequencer(segmentation, pipeline);
    auto summary = sequencer.run(blipFiles);
    EXPECT_EQ(1u, summary.chunks);
    EXPECT_EQ(1, summary.nextFlightId);

    EXPECT_EQ(chunked, sortedRows(61));
}

TEST_F(ChunkSequencerTest, RouteScopeFiltersOutputOnly) {
    auto airports = writeFile("airports.csv", "icao,iso_country\nEGLL,GB\nEGPH,GB\nLFPG,FR\n");
    pipeline.airportsFile = airports.string();

    ChunkSequencer sequencer(segmentation, pipeline);
    EXPECT_EQ(2u, sequencer.routeScope().airportCount());
    auto summary = sequencer.run(files);

    EXPECT_EQ(21u, summary.recordsSegmented);
    EXPECT_EQ(16u, summary.recordsRouted);
    EXPECT_EQ(5u, summary.recordsOutOfScope);
    // Z still took an id
    EXPECT_EQ(3, summary.nextFlightId);

    for (const auto &line : readLines(dir / "out" / "flights_day_061.csv")) {
        EXPECT_EQ(std::string::npos, line.find(",Z,"));
    }
}

TEST_F(ChunkSequencerTest, FlightInfoTableWrittenAtEnd) {
    pipeline.flightInfoFile = (dir / "flight_info.csv").string();
    ChunkSequencer sequencer(segmentation, pipeline);
    sequencer.run(files);

    const auto *y = sequencer.flightSummary().find(1);
    ASSERT_NE(nullptr, y);
    EXPECT_EQ(11u, y->messageCount);
    EXPECT_EQ(t0 + hours(22), y->firstMessage);
    EXPECT_EQ(t0 + hours(23.5) + minutes(3), y->lastMessage);

    auto lines = readLines(dir / "flight_info.csv");
    ASSERT_EQ(4u, lines.size());
    EXPECT_EQ(0u, lines[1].rfind("0,X,EGLL,EGPH,", 0));
    EXPECT_EQ(0u, lines[2].rfind("1,Y,EGLL,EGPH,", 0));
}

TEST_F(ChunkSequencerTest, StateCarriedBetweenChunks) {
    ChunkSequencer sequencer(segmentation, pipeline);
    auto result = sequencer.processChunk(makeTrack("Y", "EGLL", "EGPH", t0 + hours(22), 5), {});
    EXPECT_EQ(1, sequencer.nextFlightId());
    EXPECT_EQ(1u, sequencer.tailState().size());

    result = sequencer.processChunk(makeTrack("Y", "EGLL", "EGPH", t0 + hours(23), 2), {});
    EXPECT_EQ(1u, result.stats.flightsContinued);
    EXPECT_EQ(0, result.records.front().flightId.value());
    EXPECT_EQ(1, sequencer.nextFlightId());
}

TEST_F(ChunkSequencerTest, ReturnedRecordsAreTheRoutedOnes) {
    auto airports = writeFile("airports.csv", "icao,iso_country\nEGLL,GB\nEGPH,GB\n");
    pipeline.airportsFile = airports.string();
    ChunkSequencer sequencer(segmentation, pipeline);

    auto records = makeTrack("Y", "EGLL", "EGPH", t0, 5);
    appendTo(records, makeTrack("Z", "LFPG", "EIDW", t0, 5));
    auto result = sequencer.processChunk(records, {});

    ASSERT_EQ(5u, result.records.size());
    EXPECT_EQ("Y", result.records.front().position.aircraftId);
    EXPECT_EQ(10u, result.stats.recordsOut);
    // Z's flight still counts for the id counter
    EXPECT_EQ(2, sequencer.nextFlightId());
}

TEST_F(ChunkSequencerTest, EmptyChunkKeepsCounter) {
    ChunkSequencer sequencer(segmentation, pipeline);
    sequencer.processChunk(makeTrack("Y", "EGLL", "EGPH", t0, 5), {});
    sequencer.processChunk({}, {});
    EXPECT_EQ(1, sequencer.nextFlightId());
    EXPECT_TRUE(sequencer.tailState().empty());
}

TEST_F(ChunkSequencerTest, SchemaErrorAbortsAfterEarlierChunksWritten) {
    files.push_back(writeFile("positions_3.csv", "timestamp,icao_address\n2024-03-01 00:00:00,X\n"));
    ChunkSequencer sequencer(segmentation, pipeline);

    EXPECT_THROW(sequencer.run(files), SchemaError);
    EXPECT_EQ(22u, readLines(dir / "out" / "flights_day_061.csv").size());
    EXPECT_EQ(2u, sequencer.summary().chunks);
}

TEST_F(ChunkSequencerTest, InvalidConfigurationRejected) {
    pipeline.chunkSizeFiles = 0;
    EXPECT_THROW({ ChunkSequencer sequencer(segmentation, pipeline); }, ConfigError);

    pipeline.chunkSizeFiles = 1;
    segmentation.hardGapHours = -1;
    EXPECT_THROW({ ChunkSequencer sequencer(segmentation, pipeline); }, ConfigError);
}

TEST_F(ChunkSequencerTest, SummaryDump) {
    ChunkSequencer sequencer(segmentation, pipeline);
    auto summary = sequencer.run(files);
    std::ostringstream out;
    summary.dump(out);
    EXPECT_NE(out.str().find("chunks: 2 (2 files)"), std::string::npos);
    EXPECT_NE(out.str().find("next flight id: 3"), std::string::npos);
}
