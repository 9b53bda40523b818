/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Class that reads a batch of aircraft position reports.
 *
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <vector>

#include "PositionRecord.hpp"

namespace flight_seg {

/**
 * The records of one input file (or of several concatenated ones), with the
 * names of the passthrough columns their PositionRecord::passthrough vectors
 * follow.
 */
struct PositionBatch {
    std::string source;
    std::vector<std::string> passthroughColumns;
    std::vector<PositionRecord> records;
    std::size_t skippedRows{0};
    bool hasHeader{false};

    /**
     * Append another batch, re-ordering its passthrough fields to this
     * batch's schema. A batch without a header yet adopts the other's
     * schema. Returns false if the schemas differed (the other batch's
     * missing columns are left empty and its extra ones dropped).
     */
    bool append(PositionBatch &&other);
};

class PositionFile
{
  public:
    PositionFile() = default;
    virtual ~PositionFile() = default;

    // Explicitly handle copy and move operations
    PositionFile(const PositionFile &) = default;
    PositionFile &operator=(const PositionFile &) = default;
    PositionFile(PositionFile &&) = default;
    PositionFile &operator=(PositionFile &&) = default;

    /**
     * Called for every data row that couldn't be used, with its 1-based line
     * number and the reason. The row is skipped either way.
     */
    virtual void setSkippedRowCb(std::function<void(int, const std::string &)> cb);

    /**
     * Read a whole batch from a stream.
     *
     * @param stream Comma-separated text with a header row
     * @param sourceName Used in messages only
     * @return The usable records, in file order
     * @throws SchemaError if the header lacks a required column
     */
    [[nodiscard]] virtual PositionBatch read(std::istream &stream, const std::string &sourceName);

    /**
     * @throws std::runtime_error if the file can't be opened
     * @throws SchemaError if the header lacks a required column
     */
    [[nodiscard]] virtual PositionBatch read(const std::filesystem::path &path);

    /// Names of the columns every input file must carry
    [[nodiscard]] static const std::vector<std::string> &requiredColumns();

  private:
    struct ColumnLayout {
        std::size_t timestamp{0};
        std::size_t aircraft{0};
        std::size_t latitude{0};
        std::size_t longitude{0};
        std::size_t origin{0};
        std::size_t destination{0};
        std::size_t width{0};
        std::vector<std::size_t> passthrough;
    };

    ColumnLayout parseHeader(const std::string &line, const std::string &sourceName,
                             std::vector<std::string> &passthroughNames);
    bool parseRow(int lineno, const std::string &line, const ColumnLayout &layout, PositionRecord &record);

  private:
    std::function<void(int, const std::string &)> m_skippedRowCb;
};

} // namespace flight_seg
