/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <utility>

#include "ChunkIterator.hpp"
#include "ChunkSequencer.hpp"
#include "Logging.hpp"

namespace flight_seg {

void RunSummary::dump(std::ostream &outStream) const
{
    outStream << "Run summary:" << "\n    chunks: " << chunks << " (" << files << " files)"
              << "\n    records read: " << recordsRead << " (" << rowsSkipped << " rows skipped)"
              << "\n    records segmented: " << recordsSegmented << "\n    records written: " << recordsRouted
              << " (" << recordsOutOfScope << " out of scope)" << "\n    flights: " << newFlights << " new, "
              << flightsContinued << " continued across chunks" << "\n    next flight id: " << nextFlightId
              << "\n    day partitions: " << partitions.size() << "\n";
}

ChunkSequencer::ChunkSequencer(const SegmentationConfig &segmentation, const PipelineConfig &pipeline)
    : ChunkSequencer(segmentation, pipeline, loadScope(pipeline))
{
}

ChunkSequencer::ChunkSequencer(const SegmentationConfig &segmentation, const PipelineConfig &pipeline,
                               RouteScope scope)
    : m_segmenter(segmentation), m_pipeline(pipeline), m_scope(std::move(scope)),
      m_writer(pipeline.outputDir, pipeline.outputPrefix)
{
    m_pipeline.validate();
    m_reader.setSkippedRowCb([](int lineno, const std::string &reason) {
        FLIGHTSEG_LOG_DEBUG("skipped line {}: {}", lineno, reason);
    });
}

RouteScope ChunkSequencer::loadScope(const PipelineConfig &pipeline)
{
    if (pipeline.airportsFile.empty()) {
        return RouteScope{};
    }
    return RouteScope::fromAirportsFile(pipeline.airportsFile, pipeline.scopeCountry);
}

RunSummary ChunkSequencer::run(const std::vector<std::filesystem::path> &files)
{
    ChunkRange chunks(files, m_pipeline.chunkSizeFiles, &m_reader);
    FLIGHTSEG_LOG_INFO("processing {} files in {} chunks of up to {}", files.size(), chunks.chunkCount(),
                       m_pipeline.chunkSizeFiles);

    for (auto &chunk : chunks) {
        for (const auto &file : chunk.files) {
            FLIGHTSEG_LOG_DEBUG("chunk {}: {}", chunk.index, file.string());
        }
        ++m_summary.chunks;
        m_summary.files += chunk.files.size();
        m_summary.recordsRead += chunk.batch.records.size();
        m_summary.rowsSkipped += chunk.batch.skippedRows;

        processChunk(std::move(chunk.batch.records), chunk.batch.passthroughColumns);
    }

    if (!m_pipeline.flightInfoFile.empty()) {
        m_flightSummary.writeFile(m_pipeline.flightInfoFile);
        FLIGHTSEG_LOG_INFO("wrote {} flights to {}", m_flightSummary.size(), m_pipeline.flightInfoFile);
    }
    return m_summary;
}

SegmentationResult ChunkSequencer::processChunk(std::vector<PositionRecord> records,
                                                const std::vector<std::string> &passthroughColumns)
{
    FlightId firstId = m_nextFlightId;
    auto result = m_segmenter.segment(std::move(records), m_tailState, m_nextFlightId);

    // Tail state and the id counter come from the unfiltered output
    m_tailState = result.tailState;
    m_nextFlightId = std::max(m_nextFlightId, result.nextFlightId);

    m_summary.recordsSegmented += result.records.size();
    m_summary.flightsContinued += result.stats.flightsContinued;
    m_summary.newFlights += static_cast<std::size_t>(m_nextFlightId - firstId);
    m_summary.nextFlightId = m_nextFlightId;

    auto &routed = result.records;
    auto dropped = m_scope.apply(routed);
    m_summary.recordsRouted += routed.size();
    m_summary.recordsOutOfScope += dropped;
    if (!m_scope.admitsAll()) {
        FLIGHTSEG_LOG_INFO("route scope: {} records kept, {} dropped", routed.size(), dropped);
    }

    auto written = m_writer.write(routed, passthroughColumns);
    for (const auto &[day, rows] : written) {
        m_summary.partitions.insert(day);
        FLIGHTSEG_LOG_DEBUG("{}: {} rows", m_writer.partitionPath(day).filename().string(), rows);
    }
    if (!written.empty()) {
        FLIGHTSEG_LOG_INFO("appended {} rows to {} day partitions", routed.size(), written.size());
    }

    m_flightSummary.add(routed);
    return result;
}

} // namespace flight_seg
