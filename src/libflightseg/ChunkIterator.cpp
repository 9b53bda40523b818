/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Implementation of the streaming chunk iterator.
 */

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "ChunkIterator.hpp"
#include "Logging.hpp"

namespace flight_seg {

// =============================================================================
// ChunkIterator Implementation
// =============================================================================

ChunkIterator::ChunkIterator(const std::vector<std::filesystem::path> *files, std::size_t chunkSize,
                             PositionFile *reader, std::shared_ptr<std::optional<std::vector<std::string>>> schema)
    : m_files(files), m_chunkSize(chunkSize), m_reader(reader), m_schema(std::move(schema)), m_isEnd(false)
{
    if (!m_files || !m_reader || !m_schema) {
        m_isEnd = true;
        return;
    }
    advance();
}

void ChunkIterator::advance()
{
    if (m_isEnd || !m_files || m_nextFile >= m_files->size()) {
        m_isEnd = true;
        m_current = PositionChunk{};
        return;
    }

    PositionChunk chunk;
    chunk.index = m_nextIndex++;
    if (m_schema->has_value()) {
        chunk.batch.passthroughColumns = m_schema->value();
        chunk.batch.hasHeader = true;
    }

    std::size_t last = std::min(m_nextFile + m_chunkSize, m_files->size());
    for (; m_nextFile < last; ++m_nextFile) {
        const auto &path = (*m_files)[m_nextFile];
        chunk.files.push_back(path);

        auto batch = m_reader->read(path);
        if (!m_schema->has_value() && batch.hasHeader) {
            // the first file with a header fixes the schema for the whole run
            *m_schema = batch.passthroughColumns;
        }
        if (!chunk.batch.append(std::move(batch))) {
            FLIGHTSEG_LOG_WARN("{}: passthrough columns differ from the run's; aligned by name",
                               path.filename().string());
        }
    }

    FLIGHTSEG_LOG_INFO("chunk {}: {} files, {} records ({} rows skipped)", chunk.index, chunk.files.size(),
                       chunk.batch.records.size(), chunk.batch.skippedRows);
    m_current = std::move(chunk);
}

ChunkIterator::reference ChunkIterator::operator*() const
{
    if (m_isEnd) {
        throw std::out_of_range("ChunkIterator: dereferencing end iterator");
    }
    return m_current;
}

ChunkIterator::value_type &ChunkIterator::operator*()
{
    if (m_isEnd) {
        throw std::out_of_range("ChunkIterator: dereferencing end iterator");
    }
    return m_current;
}

ChunkIterator::pointer ChunkIterator::operator->() const
{
    if (m_isEnd) {
        throw std::out_of_range("ChunkIterator: dereferencing end iterator");
    }
    return &m_current;
}

ChunkIterator &ChunkIterator::operator++()
{
    advance();
    return *this;
}

bool ChunkIterator::operator==(const ChunkIterator &other) const
{
    // Two end iterators are equal
    if (m_isEnd && other.m_isEnd) {
        return true;
    }
    if (m_isEnd != other.m_isEnd) {
        return false;
    }
    return (m_files == other.m_files) && (m_nextFile == other.m_nextFile);
}

bool ChunkIterator::operator!=(const ChunkIterator &other) const { return !(*this == other); }

// =============================================================================
// ChunkRange Implementation
// =============================================================================

ChunkRange::ChunkRange(const std::vector<std::filesystem::path> &files, std::size_t chunkSize, PositionFile *reader)
    : m_files(files), m_chunkSize(chunkSize), m_reader(reader)
{
    if (m_chunkSize == 0) {
        throw std::invalid_argument("ChunkRange: chunk size must be at least 1");
    }
    if (!m_reader) {
        throw std::invalid_argument("ChunkRange: no reader");
    }
}

ChunkIterator ChunkRange::begin() const
{
    return ChunkIterator(&m_files, m_chunkSize, m_reader, std::make_shared<std::optional<std::vector<std::string>>>());
}

ChunkIterator ChunkRange::end() const { return ChunkIterator(); }

std::size_t ChunkRange::chunkCount() const { return (m_files.size() + m_chunkSize - 1) / m_chunkSize; }

} // namespace flight_seg
