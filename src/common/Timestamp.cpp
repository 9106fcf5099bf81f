/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Timestamp.hpp"

#include <ctime>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libhubtags/Error.hpp"


namespace hubtags {
namespace common {

namespace regex {
    // date, time, optional fraction of second, time zone designator
    static const boost::regex iso8601{
        "^(\\d{4})-(\\d{2})-(\\d{2})[Tt ](\\d{2}):(\\d{2}):(\\d{2})(?:[\\.,](\\d+))?(?:([Zz])|([+-])(\\d{2}):?(\\d{2}))$"};
}

/**
 * Parse a ISO 8601 date-time as published by Docker Hub,
 * e.g. "2023-10-04T12:34:56.123456Z" or "2020-01-01T02:00:00+02:00"
 */
Timestamp parseTimestamp(const std::string& iso8601) {
    boost::smatch matches;
    if(!boost::regex_match(iso8601, matches, regex::iso8601)) {
        auto message = boost::format("Failed to parse timestamp '%s': expected ISO 8601 date and time"
                                     " with time zone designator") % iso8601;
        HUBTAGS_THROW_ERROR(message.str());
    }

    auto tm = std::tm{};
    tm.tm_year = std::stoi(matches[1].str()) - 1900;
    tm.tm_mon  = std::stoi(matches[2].str()) - 1;
    tm.tm_mday = std::stoi(matches[3].str());
    tm.tm_hour = std::stoi(matches[4].str());
    tm.tm_min  = std::stoi(matches[5].str());
    tm.tm_sec  = std::stoi(matches[6].str());

    if(tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31
       || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        auto message = boost::format("Failed to parse timestamp '%s': date or time out of range") % iso8601;
        HUBTAGS_THROW_ERROR(message.str());
    }

    auto secondsSinceEpoch = timegm(&tm);

    // group 8 is the 'Z' designator, groups 9 to 11 are sign, hours and minutes of an offset
    if(matches[9].matched) {
        auto hours = std::stoi(matches[10].str());
        auto minutes = std::stoi(matches[11].str());
        if(hours > 23 || minutes > 59) {
            auto message = boost::format("Failed to parse timestamp '%s': time zone offset out of range") % iso8601;
            HUBTAGS_THROW_ERROR(message.str());
        }
        auto offset = hours * 3600 + minutes * 60;
        secondsSinceEpoch += (matches[9].str() == "+") ? -offset : offset;
    }

    auto timestamp = std::chrono::system_clock::from_time_t(secondsSinceEpoch);

    if(matches[7].matched) {
        // keep nanosecond resolution at most
        auto fraction = matches[7].str().substr(0, 9);
        fraction.append(9 - fraction.size(), '0');
        auto nanoseconds = std::chrono::nanoseconds{std::stol(fraction)};
        timestamp += std::chrono::duration_cast<Timestamp::duration>(nanoseconds);
    }

    return timestamp;
}

/**
 * Format a timestamp in UTC, e.g. "2020-01-01 00:00:00 UTC"
 */
std::string formatTimestamp(const Timestamp& timestamp) {
    auto time = std::chrono::system_clock::to_time_t(timestamp);
    auto tm = std::tm{};
    if(gmtime_r(&time, &tm) == nullptr) {
        auto message = boost::format("Failed to convert time %d to UTC calendar time") % time;
        HUBTAGS_THROW_ERROR(message.str());
    }
    char buffer[64];
    if(strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &tm) == 0) {
        HUBTAGS_THROW_ERROR("Failed to format timestamp");
    }
    return buffer;
}

}
}
