/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_Utility_hpp
#define cli_Utility_hpp

#include <string>
#include <tuple>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libhubtags/Logger.hpp"
#include "libhubtags/Error.hpp"
#include "libhubtags/CLIArguments.hpp"

namespace hubtags {
namespace cli {
namespace utility {

/**
 * Splits a command line into the name with its options (and their values) and the
 * positional arguments, which start at the first token that is neither an option
 * nor an option value.
 *
 * E.g. "hubtags --verbose tags -a arm64 ubuntu" gives ("hubtags --verbose", "tags -a arm64 ubuntu").
 */
std::tuple<libhubtags::CLIArguments, libhubtags::CLIArguments> groupOptionsAndPositionalArguments(
        const libhubtags::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

/**
 * Parses the options in nameAndOptionArgs (the name is skipped). Invalid options are
 * reported as usage errors pointing to 'hubtags help [command]'.
 */
boost::program_options::variables_map parseOptions(const libhubtags::CLIArguments& nameAndOptionArgs,
        const boost::program_options::options_description& optionsDescription, const std::string& command);

void validateNumberOfPositionalArguments(const libhubtags::CLIArguments& positionalArgs,
        int min, int max, const std::string& command);

// Prints a user mistake on stderr and throws it with log level INFO, so that no trace is shown.
[[noreturn]] void reportUsageError(const boost::format& message);

void printLog(const std::string& message, libhubtags::LogLevel logLevel,
              std::ostream& generalStream=std::cout, std::ostream& diagnosticStream=std::cerr);
void printLog(const boost::format& message, libhubtags::LogLevel logLevel,
              std::ostream& generalStream=std::cout, std::ostream& diagnosticStream=std::cerr);

}
}
}

#endif
