/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhubtags_Error_hpp
#define libhubtags_Error_hpp

#include <exception>
#include <string>
#include <vector>
#include <utility>
#include <cstring>

#include <boost/optional.hpp>

#include "libhubtags/LogLevel.hpp"

namespace libhubtags {

/**
 * Exception carrying an error trace and the registry context of the failure.
 *
 * The first trace entry is created by HUBTAGS_THROW_ERROR at the point of failure.
 * Each HUBTAGS_RETHROW_ERROR on the way up appends one entry, so that the trace
 * reads from the most nested error to the outermost caller.
 *
 * The context is a list of (subject, value) pairs, e.g. ("repository", "library/ubuntu")
 * or ("tag", "22.04"), attached by the layers that know them. Only the first value
 * recorded for a subject is kept, which is the most specific one.
 */
class Error : public std::exception {
public:
    struct TraceEntry {
        std::string errorMessage;
        std::string fileName;
        int fileLine;
        std::string functionName;
    };
    using Context = std::vector<std::pair<std::string, std::string>>;

public:
    Error(LogLevel logLevel, TraceEntry entry)
        : logLevel{ logLevel }
        , trace{ std::move(entry) }
    {}

    // Message of the innermost error, as if it had propagated without rethrows.
    const char* what() const noexcept override {
        return trace.front().errorMessage.c_str();
    }

    void appendTraceEntry(TraceEntry entry) {
        trace.push_back(std::move(entry));
    }
    const std::vector<TraceEntry>& getTrace() const {
        return trace;
    }

    Error& addContext(const std::string& subject, const std::string& value);
    const Context& getContext() const {
        return context;
    }
    boost::optional<std::string> getContext(const std::string& subject) const;

    LogLevel getLogLevel() const {
        return logLevel;
    }
    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel;
    std::vector<TraceEntry> trace;
    Context context;
};

bool operator==(const Error::TraceEntry&, const Error::TraceEntry&);
bool operator!=(const Error::TraceEntry&, const Error::TraceEntry&);

std::string describeExceptionType(const std::exception&);

/**
 * Rethrows the exception currently being handled with an additional trace entry.
 * A libhubtags::Error is extended in place, any other std::exception is wrapped
 * into a new Error whose first entry records its what() and dynamic type.
 * Must be called from within a catch block.
 */
[[noreturn]] void rethrowWithTraceEntry(const std::exception&, Error::TraceEntry,
                                        boost::optional<LogLevel> logLevel = {});

}


#define HUBTAGS_FILENAME (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define HUBTAGS_TRACE_ENTRY(errorMessage) \
    libhubtags::Error::TraceEntry{errorMessage, HUBTAGS_FILENAME, __LINE__, __func__}

#define HUBTAGS_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME
#define HUBTAGS_THROW_ERROR_2(errorMessage, logLevel) \
    throw libhubtags::Error{logLevel, HUBTAGS_TRACE_ENTRY(errorMessage)}
#define HUBTAGS_THROW_ERROR_1(errorMessage) HUBTAGS_THROW_ERROR_2(errorMessage, libhubtags::LogLevel::ERROR)
#define HUBTAGS_THROW_ERROR(...) \
    HUBTAGS_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, HUBTAGS_THROW_ERROR_2, HUBTAGS_THROW_ERROR_1)(__VA_ARGS__)

#define HUBTAGS_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME
#define HUBTAGS_RETHROW_ERROR_3(exception, errorMessage, logLevel) \
    libhubtags::rethrowWithTraceEntry(exception, HUBTAGS_TRACE_ENTRY(errorMessage), logLevel)
#define HUBTAGS_RETHROW_ERROR_2(exception, errorMessage) \
    libhubtags::rethrowWithTraceEntry(exception, HUBTAGS_TRACE_ENTRY(errorMessage))
#define HUBTAGS_RETHROW_ERROR(...) \
    HUBTAGS_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, HUBTAGS_RETHROW_ERROR_3, HUBTAGS_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
