/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "LogLevel.hpp"

namespace libhubtags {

std::string toString(LogLevel level) {
    switch(level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARN:    return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::GENERAL: return "GENERAL";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, LogLevel level) {
    return os << toString(level);
}

}
