/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Error.hpp"

#include <algorithm>
#include <ios>
#include <stdexcept>
#include <system_error>

namespace libhubtags {

Error& Error::addContext(const std::string& subject, const std::string& value) {
    auto it = std::find_if(context.cbegin(), context.cend(),
        [&subject](const Context::value_type& entry) { return entry.first == subject; });
    if(it == context.cend()) {
        context.emplace_back(subject, value);
    }
    return *this;
}

boost::optional<std::string> Error::getContext(const std::string& subject) const {
    for(const auto& entry : context) {
        if(entry.first == subject) {
            return entry.second;
        }
    }
    return {};
}

bool operator==(const Error::TraceEntry& lhs, const Error::TraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

bool operator!=(const Error::TraceEntry& lhs, const Error::TraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string describeExceptionType(const std::exception& e) {
    // ios_base::failure derives from system_error since C++11
    if(dynamic_cast<const std::ios_base::failure*>(&e)) {
        return "std::ios_base::failure";
    }
    if(dynamic_cast<const std::system_error*>(&e)) {
        return "std::system_error";
    }
    if(dynamic_cast<const std::logic_error*>(&e)) {
        return "std::logic_error";
    }
    if(dynamic_cast<const std::runtime_error*>(&e)) {
        return "std::runtime_error";
    }
    return "std::exception";
}

void rethrowWithTraceEntry(const std::exception& e, Error::TraceEntry entry, boost::optional<LogLevel> logLevel) {
    if(dynamic_cast<const Error*>(&e) == nullptr) {
        auto origin = Error::TraceEntry{e.what(), "unspecified location", -1, describeExceptionType(e)};
        auto error = Error{logLevel.value_or(LogLevel::ERROR), std::move(origin)};
        error.appendTraceEntry(std::move(entry));
        throw error;
    }

    // extend the original object so that its dynamic type and context survive
    try {
        throw;
    }
    catch(Error& error) {
        if(logLevel) {
            error.setLogLevel(*logLevel);
        }
        error.appendTraceEntry(std::move(entry));
        throw;
    }
}

}
