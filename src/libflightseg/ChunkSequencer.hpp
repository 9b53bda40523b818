/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Drives segmentation over an ordered list of input files.
 *
 * The sequencer is the only owner of the state that crosses chunk
 * boundaries: the flight tail snapshot and the next free flight id. Chunks
 * are processed strictly in order; chunk n+1 is not read until chunk n's
 * tail snapshot exists.
 *
 * For every chunk it segments the records, filters the result to the
 * route scope, appends it to the day partitions and folds it into the
 * flight summary. Any exception aborts the loop; partitions already
 * written are left as they are.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "DayPartitionWriter.hpp"
#include "FlightSegmenter.hpp"
#include "FlightSummary.hpp"
#include "FlightTailState.hpp"
#include "PositionFile.hpp"
#include "RouteScope.hpp"
#include "SegmentationConfig.hpp"

namespace flight_seg {

struct RunSummary {
    std::size_t chunks{0};
    std::size_t files{0};
    std::size_t recordsRead{0};
    std::size_t rowsSkipped{0};
    std::size_t recordsSegmented{0};
    std::size_t recordsRouted{0};
    std::size_t recordsOutOfScope{0};
    std::size_t flightsContinued{0};
    std::size_t newFlights{0};
    FlightId nextFlightId{0};
    std::set<int> partitions;

    void dump(std::ostream &outStream) const;
};

class ChunkSequencer
{
  public:
    /**
     * @throws ConfigError if either configuration is invalid
     * @throws SchemaError, std::runtime_error if the airports file can't be loaded
     */
    ChunkSequencer(const SegmentationConfig &segmentation, const PipelineConfig &pipeline);
    ChunkSequencer(const SegmentationConfig &segmentation, const PipelineConfig &pipeline, RouteScope scope);
    virtual ~ChunkSequencer() = default;

    ChunkSequencer(const ChunkSequencer &) = delete;
    ChunkSequencer &operator=(const ChunkSequencer &) = delete;

    /**
     * Process the files in order, chunk by chunk, and write the flight
     * info table at the end if one is configured.
     */
    RunSummary run(const std::vector<std::filesystem::path> &files);

    /**
     * Segment, route and write one chunk already in memory.
     *
     * Tail state and the id counter are taken before the route scope is
     * applied; the returned records are the routed ones.
     *
     * @return the chunk's segmentation result
     */
    SegmentationResult processChunk(std::vector<PositionRecord> records,
                                    const std::vector<std::string> &passthroughColumns);

    [[nodiscard]] FlightId nextFlightId() const { return m_nextFlightId; }
    [[nodiscard]] const FlightTailState &tailState() const { return m_tailState; }
    [[nodiscard]] const FlightSummary &flightSummary() const { return m_flightSummary; }
    [[nodiscard]] const RunSummary &summary() const { return m_summary; }
    [[nodiscard]] const RouteScope &routeScope() const { return m_scope; }

  private:
    static RouteScope loadScope(const PipelineConfig &pipeline);

    FlightSegmenter m_segmenter;
    PipelineConfig m_pipeline;
    RouteScope m_scope;
    PositionFile m_reader;
    DayPartitionWriter m_writer;
    FlightSummary m_flightSummary;

    FlightTailState m_tailState;
    FlightId m_nextFlightId{0};
    RunSummary m_summary;
};

} // namespace flight_seg
