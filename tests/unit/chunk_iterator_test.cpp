/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * Unit tests for streaming chunks of input files
 */

#include <gtest/gtest.h>
#include <ChunkIterator.hpp>
#include <Errors.hpp>
#include <stdexcept>
#include <utility>

#include "TestHelpers.hpp"

using namespace flight_seg;
using namespace flight_seg::test;

class ChunkIteratorTest : public ScratchDirTest {
protected:
    PositionFile reader;
    Timestamp t0 = baseTime();

    std::vector<std::filesystem::path> writeFiles(int count, int recordsEach) {
        std::vector<std::filesystem::path> files;
        for (int i = 0; i < count; ++i) {
            auto records = makeTrack("AC" + std::to_string(i), "EGLL", "EGPH", t0 + hours(i), recordsEach);
            files.push_back(writeFile("positions_" + std::to_string(i) + ".csv", positionCsv(records)));
        }
        return files;
    }
};

TEST_F(ChunkIteratorTest, GroupsFilesIntoChunks) {
    auto files = writeFiles(5, 3);
    ChunkRange range(files, 2, &reader);
    EXPECT_EQ(3u, range.chunkCount());

    std::vector<std::size_t> filesPerChunk;
    std::vector<std::size_t> recordsPerChunk;
    std::size_t expectedIndex = 0;
    for (const auto &chunk : range) {
        EXPECT_EQ(expectedIndex++, chunk.index);
        filesPerChunk.push_back(chunk.files.size());
        recordsPerChunk.push_back(chunk.batch.records.size());
    }
    EXPECT_EQ((std::vector<std::size_t>{2, 2, 1}), filesPerChunk);
    EXPECT_EQ((std::vector<std::size_t>{6, 6, 3}), recordsPerChunk);
}

TEST_F(ChunkIteratorTest, FilesKeepTheirOrder) {
    auto files = writeFiles(3, 1);
    ChunkRange range(files, 3, &reader);

    auto it = range.begin();
    ASSERT_NE(range.end(), it);
    EXPECT_TRUE(files == it->files);
    EXPECT_EQ("AC0", it->batch.records[0].aircraftId);
    EXPECT_EQ("AC2", it->batch.records[2].aircraftId);
    ++it;
    EXPECT_EQ(range.end(), it);
}

TEST_F(ChunkIteratorTest, RecordsCanBeMovedOutOfAChunk) {
    auto files = writeFiles(2, 3);
    ChunkRange range(files, 1, &reader);

    std::vector<std::vector<PositionRecord>> taken;
    for (auto &chunk : range) {
        taken.push_back(std::move(chunk.batch.records));
    }
    ASSERT_EQ(2u, taken.size());
    ASSERT_EQ(3u, taken[1].size());
    EXPECT_EQ("AC1", taken[1].front().aircraftId);
}

TEST_F(ChunkIteratorTest, ChunkLargerThanFileList) {
    auto files = writeFiles(2, 4);
    ChunkRange range(files, 10, &reader);
    EXPECT_EQ(1u, range.chunkCount());

    std::size_t chunks = 0;
    for (const auto &chunk : range) {
        EXPECT_EQ(8u, chunk.batch.records.size());
        ++chunks;
    }
    EXPECT_EQ(1u, chunks);
}

TEST_F(ChunkIteratorTest, NoFilesNoChunks) {
    std::vector<std::filesystem::path> files;
    ChunkRange range(files, 5, &reader);
    EXPECT_EQ(0u, range.chunkCount());
    EXPECT_EQ(range.begin(), range.end());
}

TEST_F(ChunkIteratorTest, InvalidArguments) {
    std::vector<std::filesystem::path> files;
    EXPECT_THROW({ ChunkRange range(files, 0, &reader); }, std::invalid_argument);
    EXPECT_THROW({ ChunkRange range(files, 1, nullptr); }, std::invalid_argument);
}

TEST_F(ChunkIteratorTest, DereferencingEndThrows) {
    ChunkIterator end;
    EXPECT_THROW((void)*end, std::out_of_range);
    EXPECT_THROW((void)end.operator->(), std::out_of_range);
}

TEST_F(ChunkIteratorTest, SchemaErrorPropagates) {
    std::vector<std::filesystem::path> files{writeFile("bad.csv", "timestamp,icao_address\n")};
    ChunkRange range(files, 1, &reader);
    EXPECT_THROW((void)range.begin(), SchemaError);
}

TEST_F(ChunkIteratorTest, MissingFileThrows) {
    std::vector<std::filesystem::path> files{dir / "absent.csv"};
    ChunkRange range(files, 1, &reader);
    EXPECT_THROW((void)range.begin(), std::runtime_error);
}

TEST_F(ChunkIteratorTest, FirstFileWithHeaderFixesSchema) {
    auto track = makeTrack("X", "EGLL", "EGPH", t0, 2);
    std::vector<std::filesystem::path> files{
        writeFile("a_empty.csv", ""),
        writeFile("b_callsign.csv", positionCsv(track, true)),
        writeFile("c_plain.csv", positionCsv(track, false)),
    };

    ChunkRange range(files, 1, &reader);
    std::vector<std::vector<std::string>> schemas;
    std::vector<std::size_t> passthroughWidths;
    for (const auto &chunk : range) {
        schemas.push_back(chunk.batch.passthroughColumns);
        for (const auto &record : chunk.batch.records) {
            passthroughWidths.push_back(record.passthrough.size());
        }
    }

    ASSERT_EQ(3u, schemas.size());
    EXPECT_TRUE(schemas[0].empty());
    EXPECT_EQ(std::vector<std::string>{"callsign"}, schemas[1]);
    // the later file without the column is aligned to the run's schema
    EXPECT_EQ(std::vector<std::string>{"callsign"}, schemas[2]);
    EXPECT_EQ((std::vector<std::size_t>{1, 1, 1, 1}), passthroughWidths);
}

TEST_F(ChunkIteratorTest, SkippedRowsAddUp) {
    std::string header = "timestamp,icao_address,latitude,longitude,departure_airport_icao,arrival_airport_icao\n";
    std::vector<std::filesystem::path> files{
        writeFile("a.csv", header + "bad,X,1,2,EGLL,EGPH\n2024-03-01 00:00:00,X,1,2,EGLL,EGPH\n"),
        writeFile("b.csv", header + "bad,X,1,2,EGLL,EGPH\nbad,X,1,2,EGLL,EGPH\n"),
    };

    ChunkRange range(files, 2, &reader);
    auto it = range.begin();
    EXPECT_EQ(3u, it->batch.skippedRows);
    EXPECT_EQ(1u, it->batch.records.size());
}
