/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libhubtags/Logger.hpp"

#include <chrono>
#include <vector>

#include <unistd.h>

#include <boost/algorithm/string/join.hpp>

#include "libhubtags/utility/process.hpp"

namespace libhubtags {

Logger& Logger::getInstance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level{ LogLevel::WARN }
{
    try {
        instanceID = (boost::format("%s-%d") % process::getHostname() % getpid()).str();
    }
    catch(const Error&) {
        instanceID = (boost::format("unknown-%d") % getpid()).str();
    }
}

void Logger::log(const std::string& message, const std::string& subsystem, LogLevel logLevel,
                 std::ostream& generalStream, std::ostream& diagnosticStream) {
    if(logLevel < level) {
        return;
    }

    if(logLevel == LogLevel::GENERAL) {
        generalStream << message << std::endl;
    }
    else {
        diagnosticStream << makePrefix(logLevel, subsystem) << message << std::endl;
    }
}

void Logger::log(const boost::format& message, const std::string& subsystem, LogLevel logLevel,
                 std::ostream& generalStream, std::ostream& diagnosticStream) {
    log(message.str(), subsystem, logLevel, generalStream, diagnosticStream);
}

void Logger::logErrorTrace(const Error& error, const std::string& subsystem, std::ostream& diagnosticStream) {
    if(error.getLogLevel() < level) {
        return;
    }

    diagnosticStream << makePrefix(LogLevel::ERROR, subsystem)
                     << "Error trace (most nested error last):" << std::endl;

    const auto& trace = error.getTrace();
    for(size_t i=0; i!=trace.size(); ++i) {
        const auto& entry = trace[trace.size()-i-1];
        auto line = boost::format("#%-3.3s %s at %s:%s %s\n")
            % i % entry.functionName % entry.fileName
            % (entry.fileLine != -1 ? std::to_string(entry.fileLine) : "")
            % entry.errorMessage;
        diagnosticStream << line;
    }

    if(!error.getContext().empty()) {
        auto pairs = std::vector<std::string>{};
        for(const auto& entry : error.getContext()) {
            pairs.push_back(entry.first + "=" + entry.second);
        }
        diagnosticStream << "Context: " << boost::algorithm::join(pairs, " ") << std::endl;
    }
}

std::string Logger::makePrefix(LogLevel logLevel, const std::string& subsystem) const {
    auto sinceStart = std::chrono::steady_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceStart);
    auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(sinceStart - seconds);

    auto prefix = boost::format("[%d.%09d] [%s] [%s] [%s] ")
        % seconds.count() % nanoseconds.count() % instanceID % subsystem % logLevel;
    return prefix.str();
}

}
