/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Streaming iterator over fixed-size chunks of input files.
 *
 * Chunks are read lazily: dereferencing an iterator gives the chunk that
 * was read when the iterator last advanced, and only that chunk is held in
 * memory. Chunk size is a throughput knob only; segmentation carries its
 * state across chunk boundaries.
 *
 * Example usage:
 * @code
 *   PositionFile reader;
 *   for (const auto &chunk : ChunkRange(files, 5, &reader)) {
 *       std::cout << "chunk " << chunk.index << ": " << chunk.batch.records.size() << " records\n";
 *   }
 * @endcode
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "PositionFile.hpp"

namespace flight_seg {

struct PositionChunk {
    std::size_t index{0};
    std::vector<std::filesystem::path> files;
    // Concatenated records, with passthrough fields in the run's schema
    PositionBatch batch;
};

class ChunkIterator
{
  public:
    // Iterator traits
    using iterator_category = std::input_iterator_tag;
    using value_type = PositionChunk;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type *;
    using reference = const value_type &;

    ChunkIterator() = default;

    // Construct begin iterator
    ChunkIterator(const std::vector<std::filesystem::path> *files, std::size_t chunkSize, PositionFile *reader,
                  std::shared_ptr<std::optional<std::vector<std::string>>> schema);

    // Iterator operations
    reference operator*() const;
    pointer operator->() const;
    // The current chunk may be moved from; advancing replaces it
    value_type &operator*();
    ChunkIterator &operator++();

    bool operator==(const ChunkIterator &other) const;
    bool operator!=(const ChunkIterator &other) const;

  private:
    void advance();

    const std::vector<std::filesystem::path> *m_files{nullptr};
    std::size_t m_chunkSize{1};
    PositionFile *m_reader{nullptr};
    // shared by every iterator of one range so the schema survives copies
    std::shared_ptr<std::optional<std::vector<std::string>>> m_schema;
    std::size_t m_nextFile{0};
    std::size_t m_nextIndex{0};
    PositionChunk m_current;
    bool m_isEnd{true};
};

/**
 * @brief Range adaptor over the chunks of an ordered file list.
 *
 * The passthrough schema is fixed by the first file that has one; later
 * files are aligned to it by column name.
 */
class ChunkRange
{
  public:
    /// @throws std::invalid_argument if chunkSize is zero or reader is null
    ChunkRange(const std::vector<std::filesystem::path> &files, std::size_t chunkSize, PositionFile *reader);

    [[nodiscard]] ChunkIterator begin() const;
    [[nodiscard]] ChunkIterator end() const;

    [[nodiscard]] std::size_t chunkCount() const;

  private:
    const std::vector<std::filesystem::path> &m_files;
    std::size_t m_chunkSize;
    PositionFile *m_reader;
};

} // namespace flight_seg
