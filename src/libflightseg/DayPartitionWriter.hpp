/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Writes labelled records into one CSV file per ordinal day.
 *
 * Partitions are named <prefix>_day_<DDD>.csv. Appending to an existing
 * partition reads it back, adds the new rows after the old ones and
 * replaces the file through a temporary, so an interrupted write never
 * leaves a half-written partition behind.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

class DayPartitionWriter
{
  public:
    DayPartitionWriter(std::filesystem::path outputDir, std::string prefix);
    virtual ~DayPartitionWriter() = default;

    DayPartitionWriter(const DayPartitionWriter &) = delete;
    DayPartitionWriter &operator=(const DayPartitionWriter &) = delete;
    DayPartitionWriter(DayPartitionWriter &&) = default;
    DayPartitionWriter &operator=(DayPartitionWriter &&) = delete;

    [[nodiscard]] std::filesystem::path partitionPath(int ordinalDay) const;

    /// Output header for a given passthrough schema
    [[nodiscard]] static std::vector<std::string> header(const std::vector<std::string> &passthroughColumns);

    /// One output row; NaN coordinates become empty cells
    [[nodiscard]] static std::vector<std::string> formatRow(const FlightRecord &record);

    /**
     * Append records to their day partitions.
     *
     * Every record must carry a flight id. Records keep their order within
     * a partition.
     *
     * @return rows written per ordinal day
     * @throws SchemaError if an existing partition has a different header
     * @throws std::runtime_error on I/O failure
     * @throws std::invalid_argument if a record has no flight id
     */
    std::map<int, std::size_t> write(const std::vector<FlightRecord> &records,
                                     const std::vector<std::string> &passthroughColumns);

    [[nodiscard]] std::size_t rowsWritten() const { return m_rowsWritten; }

  private:
    void appendPartition(int ordinalDay, const std::vector<const FlightRecord *> &rows,
                         const std::vector<std::string> &header);

    std::filesystem::path m_outputDir;
    std::string m_prefix;
    std::size_t m_rowsWritten{0};
};

} // namespace flight_seg
