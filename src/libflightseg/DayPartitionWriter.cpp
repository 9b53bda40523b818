/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "Csv.hpp"
#include "DayPartitionWriter.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "Timestamp.hpp"

namespace flight_seg {

namespace {

constexpr const char *TEMP_SUFFIX = ".tmp";

// Fewest significant digits (15 to 17) that read back as the same double
std::string formatCoordinate(double value)
{
    if (std::isnan(value)) {
        return "";
    }
    constexpr int maxDigits = std::numeric_limits<double>::max_digits10;
    std::string text;
    for (int precision = std::numeric_limits<double>::digits10; precision <= maxDigits; ++precision) {
        std::ostringstream out;
        out << std::setprecision(precision) << value;
        text = out.str();
        if (std::strtod(text.c_str(), nullptr) == value) {
            break;
        }
    }
    return text;
}

} // namespace

DayPartitionWriter::DayPartitionWriter(std::filesystem::path outputDir, std::string prefix)
    : m_outputDir(std::move(outputDir)), m_prefix(std::move(prefix))
{
}

std::filesystem::path DayPartitionWriter::partitionPath(int ordinalDay) const
{
    std::ostringstream name;
    name << m_prefix << PARTITION_DAY_TAG << std::setw(ORDINAL_DAY_WIDTH) << std::setfill('0') << ordinalDay
         << PARTITION_EXTENSION;
    return m_outputDir / name.str();
}

std::vector<std::string> DayPartitionWriter::header(const std::vector<std::string> &passthroughColumns)
{
    std::vector<std::string> columns{COL_TIMESTAMP, COL_AIRCRAFT, COL_LATITUDE,
                                     COL_LONGITUDE, COL_ORIGIN,   COL_DESTINATION};
    columns.insert(columns.end(), passthroughColumns.begin(), passthroughColumns.end());
    columns.emplace_back(COL_FLIGHT_ID);
    return columns;
}

std::vector<std::string> DayPartitionWriter::formatRow(const FlightRecord &record)
{
    if (!record.flightId.has_value()) {
        std::stringstream msg;
        msg << "record of " << record.position.aircraftId << " at " << formatTimestamp(record.position.timestamp)
            << " has no flight id";
        throw std::invalid_argument{msg.str()};
    }

    const auto &pos = record.position;
    std::vector<std::string> row;
    row.reserve(7 + pos.passthrough.size());
    row.push_back(formatTimestamp(pos.timestamp));
    row.push_back(pos.aircraftId);
    row.push_back(formatCoordinate(pos.latitude));
    row.push_back(formatCoordinate(pos.longitude));
    row.push_back(pos.origin.value_or(""));
    row.push_back(pos.destination.value_or(""));
    row.insert(row.end(), pos.passthrough.begin(), pos.passthrough.end());
    row.push_back(std::to_string(record.flightId.value()));
    return row;
}

std::map<int, std::size_t> DayPartitionWriter::write(const std::vector<FlightRecord> &records,
                                                     const std::vector<std::string> &passthroughColumns)
{
    std::map<int, std::vector<const FlightRecord *>> byDay;
    for (const auto &record : records) {
        byDay[ordinalDay(record.position.timestamp)].push_back(&record);
    }

    std::map<int, std::size_t> written;
    if (byDay.empty()) {
        return written;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_outputDir, ec);
    if (ec) {
        throw std::runtime_error{"cannot create output directory " + m_outputDir.string() + ": " + ec.message()};
    }

    auto columns = header(passthroughColumns);
    for (const auto &[day, rows] : byDay) {
        appendPartition(day, rows, columns);
        written[day] = rows.size();
        m_rowsWritten += rows.size();
    }
    return written;
}

void DayPartitionWriter::appendPartition(int ordinalDay, const std::vector<const FlightRecord *> &rows,
                                         const std::vector<std::string> &header)
{
    auto path = partitionPath(ordinalDay);
    auto headerLine = csv::joinLine(header);

    std::vector<std::string> existing;
    if (std::filesystem::exists(path)) {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw std::runtime_error{"cannot read partition " + path.string()};
        }
        std::string line;
        if (csv::readLine(in, line)) {
            if (line != headerLine) {
                std::stringstream msg;
                msg << "partition " << path.string() << " has header \"" << line << "\", expected \"" << headerLine
                    << "\"";
                throw SchemaError{msg.str()};
            }
            while (csv::readRecord(in, line)) {
                if (!line.empty()) {
                    existing.push_back(std::move(line));
                }
            }
        }
    }

    auto tempPath = path;
    tempPath += TEMP_SUFFIX;
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error{"cannot write " + tempPath.string()};
        }
        out << headerLine << '\n';
        for (const auto &line : existing) {
            out << line << '\n';
        }
        for (const auto *record : rows) {
            out << csv::joinLine(formatRow(*record)) << '\n';
        }
        out.flush();
        if (!out) {
            throw std::runtime_error{"write failed for " + tempPath.string()};
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        throw std::runtime_error{"cannot replace " + path.string() + ": " + ec.message()};
    }

    FLIGHTSEG_LOG_DEBUG("{}: {} existing + {} new rows", path.filename().string(), existing.size(), rows.size());
}

} // namespace flight_seg
