/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#define sscanf sscanf_s
#endif

#include "Timestamp.hpp"

namespace flight_seg {

namespace {

time_t toEpochSeconds(std::tm &tm)
{
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

std::tm toUtc(time_t seconds)
{
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    return utc;
}

// Floor division so that times before the epoch still land on the right second
Timestamp floorSeconds(Timestamp ts)
{
    Timestamp seconds = ts / MS_PER_SECOND;
    if (ts % MS_PER_SECOND < 0) {
        --seconds;
    }
    return seconds;
}

bool isUtcSuffix(const std::string &suffix)
{
    std::string trimmed;
    for (char c : suffix) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            trimmed.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return trimmed.empty() || trimmed == "UTC" || trimmed == "Z" || trimmed == "+00:00" || trimmed == "+0000";
}

} // namespace

std::optional<Timestamp> parseTimestamp(const std::string &text)
{
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    char sep = 0;
    int consumed = 0;

    if (sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &sep, &hour, &minute, &second,
               &consumed) != 7) {
        return std::nullopt;
    }
    if (sep != ' ' && sep != 'T') {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    Timestamp millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        Timestamp scale = 100;
        bool anyDigit = false;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            anyDigit = true;
            ++pos;
        }
        if (!anyDigit) {
            return std::nullopt;
        }
    }
    if (!isUtcSuffix(text.substr(pos))) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - TM_YEAR_BASE;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    time_t seconds = toEpochSeconds(tm);
    return static_cast<Timestamp>(seconds) * MS_PER_SECOND + millis;
}

std::string formatTimestamp(Timestamp ts)
{
    Timestamp seconds = floorSeconds(ts);
    Timestamp millis = ts - seconds * MS_PER_SECOND;
    std::tm utc = toUtc(static_cast<time_t>(seconds));

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << " UTC";
    return out.str();
}

int ordinalDay(Timestamp ts)
{
    std::tm utc = toUtc(static_cast<time_t>(floorSeconds(ts)));
    return utc.tm_yday + 1;
}

Timestamp hoursToMs(double hours) { return static_cast<Timestamp>(std::llround(hours * MS_PER_HOUR)); }

Timestamp minutesToMs(double minutes) { return static_cast<Timestamp>(std::llround(minutes * MS_PER_MINUTE)); }

} // namespace flight_seg
