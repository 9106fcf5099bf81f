/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhubtags_Logger_hpp
#define libhubtags_Logger_hpp

#include <string>
#include <iostream>

#include <boost/format.hpp>

#include "libhubtags/LogLevel.hpp"
#include "libhubtags/Error.hpp"

namespace libhubtags {

/**
 * Process-wide logger.
 *
 * GENERAL messages are program output and are written undecorated to the general
 * stream. Every other level is a diagnostic: it is prefixed with a monotonic
 * timestamp, the instance ID (hostname-pid), the subsystem and the level, and is
 * written to the diagnostic stream, which keeps stdout free for the tag summaries.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& subsystem, LogLevel logLevel,
             std::ostream& generalStream = std::cout, std::ostream& diagnosticStream = std::cerr);
    void log(const boost::format& message, const std::string& subsystem, LogLevel logLevel,
             std::ostream& generalStream = std::cout, std::ostream& diagnosticStream = std::cerr);
    void logErrorTrace(const Error& error, const std::string& subsystem,
                       std::ostream& diagnosticStream = std::cerr);

    void setLevel(LogLevel logLevel) { level = logLevel; }
    LogLevel getLevel() const { return level; }

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makePrefix(LogLevel logLevel, const std::string& subsystem) const;

private:
    LogLevel level;
    std::string instanceID;
};

}

#endif
