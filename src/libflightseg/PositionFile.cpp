/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Reads comma-separated aircraft position batches.
 *
 */

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "Csv.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "PositionFile.hpp"
#include "Timestamp.hpp"

namespace flight_seg {

namespace {

std::optional<std::string> optionalField(const std::string &value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// Empty cells are carried as NaN; anything else must parse completely
bool parseCoordinate(const std::string &text, double &value)
{
    if (text.empty()) {
        value = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    try {
        std::size_t pos = 0;
        value = std::stod(text, &pos);
        return pos == text.size();
    } catch (const std::exception &) {
        return false;
    }
}

} // namespace

bool PositionBatch::append(PositionBatch &&other)
{
    if (source.empty()) {
        source = other.source;
    } else {
        source += "+" + other.source;
    }
    skippedRows += other.skippedRows;

    // no schema yet (and so no records): adopt the other batch's
    if (!hasHeader) {
        hasHeader = other.hasHeader;
        passthroughColumns = std::move(other.passthroughColumns);
        records = std::move(other.records);
        return true;
    }

    bool sameSchema = !other.hasHeader || other.passthroughColumns == passthroughColumns;
    if (!sameSchema) {
        std::unordered_map<std::string, std::size_t> otherIndex;
        for (std::size_t i = 0; i < other.passthroughColumns.size(); ++i) {
            otherIndex[other.passthroughColumns[i]] = i;
        }
        for (auto &record : other.records) {
            std::vector<std::string> aligned(passthroughColumns.size());
            for (std::size_t i = 0; i < passthroughColumns.size(); ++i) {
                auto it = otherIndex.find(passthroughColumns[i]);
                if (it != otherIndex.end() && it->second < record.passthrough.size()) {
                    aligned[i] = std::move(record.passthrough[it->second]);
                }
            }
            record.passthrough = std::move(aligned);
        }
    }

    records.reserve(records.size() + other.records.size());
    for (auto &record : other.records) {
        records.push_back(std::move(record));
    }
    other.records.clear();
    return sameSchema;
}

void PositionFile::setSkippedRowCb(std::function<void(int, const std::string &)> cb) { m_skippedRowCb = cb; }

const std::vector<std::string> &PositionFile::requiredColumns()
{
    static const std::vector<std::string> columns{COL_TIMESTAMP, COL_AIRCRAFT, COL_LATITUDE,
                                                  COL_LONGITUDE, COL_ORIGIN,   COL_DESTINATION};
    return columns;
}

PositionFile::ColumnLayout PositionFile::parseHeader(const std::string &line, const std::string &sourceName,
                                                     std::vector<std::string> &passthroughNames)
{
    std::vector<std::string> header;
    try {
        header = csv::splitLine(line);
    } catch (const std::invalid_argument &ex) {
        std::stringstream msg;
        msg << "invalid header in " << sourceName << " (" << ex.what() << ")";
        throw SchemaError{msg.str()};
    }

    std::vector<std::string> missing;
    auto locate = [&](const std::string &name) -> std::size_t {
        auto idx = csv::findColumn(header, name);
        if (!idx.has_value()) {
            missing.push_back(name);
            return 0;
        }
        return idx.value();
    };

    ColumnLayout layout;
    layout.timestamp = locate(COL_TIMESTAMP);
    layout.aircraft = locate(COL_AIRCRAFT);
    layout.latitude = locate(COL_LATITUDE);
    layout.longitude = locate(COL_LONGITUDE);
    layout.origin = locate(COL_ORIGIN);
    layout.destination = locate(COL_DESTINATION);
    layout.width = header.size();

    if (!missing.empty()) {
        std::stringstream msg;
        msg << "missing required columns in " << sourceName << ":";
        for (const auto &name : missing) {
            msg << " " << name;
        }
        throw SchemaError{msg.str()};
    }

    const auto &required = requiredColumns();
    passthroughNames.clear();
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (std::find(required.begin(), required.end(), header[i]) == required.end()) {
            layout.passthrough.push_back(i);
            passthroughNames.push_back(header[i]);
        }
    }
    return layout;
}

bool PositionFile::parseRow(int lineno, const std::string &line, const ColumnLayout &layout, PositionRecord &record)
{
    std::vector<std::string> fields;
    try {
        fields = csv::splitLine(line);
    } catch (const std::invalid_argument &ex) {
        if (m_skippedRowCb) {
            m_skippedRowCb(lineno, ex.what());
        }
        return false;
    }

    auto reject = [&](const std::string &reason) {
        if (m_skippedRowCb) {
            m_skippedRowCb(lineno, reason);
        }
        return false;
    };

    if (fields.size() != layout.width) {
        std::stringstream msg;
        msg << "expected " << layout.width << " fields, found " << fields.size();
        return reject(msg.str());
    }

    auto ts = parseTimestamp(fields[layout.timestamp]);
    if (!ts.has_value()) {
        return reject("unparseable timestamp '" + fields[layout.timestamp] + "'");
    }
    if (fields[layout.aircraft].empty()) {
        return reject("empty aircraft id");
    }
    if (!parseCoordinate(fields[layout.latitude], record.latitude) ||
        !parseCoordinate(fields[layout.longitude], record.longitude)) {
        return reject("unparseable coordinate");
    }

    record.timestamp = ts.value();
    record.aircraftId = fields[layout.aircraft];
    record.origin = optionalField(fields[layout.origin]);
    record.destination = optionalField(fields[layout.destination]);
    record.passthrough.clear();
    record.passthrough.reserve(layout.passthrough.size());
    for (auto idx : layout.passthrough) {
        record.passthrough.push_back(fields[idx]);
    }
    return true;
}

PositionBatch PositionFile::read(std::istream &stream, const std::string &sourceName)
{
    PositionBatch batch;
    batch.source = sourceName;

    std::string line;
    if (!csv::readLine(stream, line)) {
        // an empty file has no header at all; treat it as an empty batch
        FLIGHTSEG_LOG_WARN("{}: empty file", sourceName);
        return batch;
    }
    int lineno = 1;
    auto layout = parseHeader(line, sourceName, batch.passthroughColumns);
    batch.hasHeader = true;

    while (csv::readRecord(stream, line)) {
        ++lineno;
        if (line.empty()) {
            continue;
        }
        PositionRecord record;
        if (parseRow(lineno, line, layout, record)) {
            batch.records.push_back(std::move(record));
        } else {
            ++batch.skippedRows;
        }
    }

    if (stream.bad()) {
        std::stringstream msg;
        msg << "Couldn't read stream: " << sourceName << " line " << lineno;
        throw std::runtime_error{msg.str()};
    }

    FLIGHTSEG_LOG_DEBUG("{}: records={}, skipped={}", sourceName, batch.records.size(), batch.skippedRows);
    if (batch.skippedRows > 0) {
        FLIGHTSEG_LOG_WARN("{}: skipped {} unusable rows", sourceName, batch.skippedRows);
    }
    return batch;
}

PositionBatch PositionFile::read(const std::filesystem::path &path)
{
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw std::runtime_error{"position file not found: " + path.string()};
    }
    return read(stream, path.filename().string());
}

} // namespace flight_seg
