/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Example demonstrating chunked segmentation without writing output.
 *
 * Reads position files two at a time through ChunkRange, runs each chunk
 * through FlightSegmenter and carries the tail snapshot and the next flight
 * id from one chunk to the next by hand, which is what ChunkSequencer does
 * internally.
 *
 * Compilation:
 *   g++ -std=c++17 -I../src/libflightseg chunk_segmentation_example.cpp -L../build -lflightseg -lspdlog -lfmt
 *       -lyaml-cpp -o chunk_segmentation_example
 *
 * Usage:
 *   ./chunk_segmentation_example <positions.csv>...
 */

#include "ChunkIterator.hpp"
#include "FlightSegmenter.hpp"
#include "Logging.hpp"
#include "Timestamp.hpp"

#include <filesystem>
#include <iostream>
#include <algorithm>
#include <map>
#include <utility>
#include <vector>

using namespace flight_seg;

int main(int argc, char *argv[])
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <positions.csv>...\n";
        return 1;
    }

    std::vector<std::filesystem::path> files;
    for (int i = 1; i < argc; ++i) {
        files.emplace_back(argv[i]);
    }

    try {
        initLogging("warn");

        SegmentationConfig config;
        FlightSegmenter segmenter(config);
        PositionFile reader;

        // State handed from one chunk to the next
        FlightTailState tails;
        FlightId nextFlightId = 0;

        for (const auto &chunk : ChunkRange(files, 2, &reader)) {
            auto result = segmenter.segment(chunk.batch.records, tails, nextFlightId);
            tails = result.tailState;
            nextFlightId = result.nextFlightId;

            std::cout << "==========================================\n";
            std::cout << "Chunk " << chunk.index << " (" << chunk.files.size() << " files)\n";
            result.stats.dump(std::cout);

            // First and last message per flight
            std::map<FlightId, std::pair<Timestamp, Timestamp>> spans;
            for (const auto &record : result.records) {
                auto ts = record.position.timestamp;
                auto [it, inserted] = spans.try_emplace(record.flightId.value(), ts, ts);
                if (!inserted) {
                    it->second.first = std::min(it->second.first, ts);
                    it->second.second = std::max(it->second.second, ts);
                }
            }
            for (const auto &[id, span] : spans) {
                std::cout << "  flight " << id << ": " << formatTimestamp(span.first) << " .. "
                          << formatTimestamp(span.second) << "\n";
            }

            std::cout << "Open tails after this chunk:\n";
            tails.dump(std::cout);
        }

        std::cout << "Next flight id: " << nextFlightId << "\n";
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
