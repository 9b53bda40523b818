/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cctype>
#include <stdexcept>

#include "Csv.hpp"
#include "SegmentationConstants.hpp"

namespace flight_seg::csv {

std::vector<std::string> splitLine(const std::string &line)
{
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    std::size_t end = line.size();
    if (end > 0 && line[end - 1] == '\r') {
        --end;
    }

    for (std::size_t i = 0; i < end; ++i) {
        char c = line[i];
        if (inQuotes) {
            if (c == CSV_QUOTE) {
                if (i + 1 < end && line[i + 1] == CSV_QUOTE) {
                    field.push_back(CSV_QUOTE);
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == CSV_QUOTE) {
            inQuotes = true;
        } else if (c == CSV_SEPARATOR) {
            fields.push_back(field);
            field.clear();
        } else {
            field.push_back(c);
        }
    }

    if (inQuotes) {
        throw std::invalid_argument{"unterminated quoted field"};
    }
    fields.push_back(field);
    return fields;
}

std::string escapeField(const std::string &field)
{
    bool needsQuotes = field.find_first_of(",\"\r\n") != std::string::npos;
    if (!field.empty() && (std::isspace(static_cast<unsigned char>(field.front())) ||
                           std::isspace(static_cast<unsigned char>(field.back())))) {
        needsQuotes = true;
    }
    if (!needsQuotes) {
        return field;
    }

    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back(CSV_QUOTE);
    for (char c : field) {
        if (c == CSV_QUOTE) {
            quoted.push_back(CSV_QUOTE);
        }
        quoted.push_back(c);
    }
    quoted.push_back(CSV_QUOTE);
    return quoted;
}

std::string joinLine(const std::vector<std::string> &fields)
{
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            line.push_back(CSV_SEPARATOR);
        }
        line += escapeField(fields[i]);
    }
    return line;
}

std::optional<std::size_t> findColumn(const std::vector<std::string> &header, const std::string &name)
{
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

bool readLine(std::istream &stream, std::string &line)
{
    if (!std::getline(stream, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool readRecord(std::istream &stream, std::string &record)
{
    record.clear();
    std::string line;
    bool open = false;
    bool any = false;
    while (std::getline(stream, line)) {
        any = true;
        for (char c : line) {
            if (c == CSV_QUOTE) {
                open = !open;
            }
        }
        record += line;
        if (!open) {
            break;
        }
        record.push_back('\n');
    }
    if (!open && !record.empty() && record.back() == '\r') {
        record.pop_back();
    }
    return any;
}

} // namespace flight_seg::csv
