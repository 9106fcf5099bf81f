/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhubtags_LogLevel_hpp
#define libhubtags_LogLevel_hpp

#include <ostream>
#include <string>

namespace libhubtags {

/**
 * Severity of a log message or of an error. GENERAL marks plain program output
 * that is printed without decorations.
 */
enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

std::string toString(LogLevel);
std::ostream& operator<<(std::ostream&, LogLevel);

}

#endif
