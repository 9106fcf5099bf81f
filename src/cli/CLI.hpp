/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CLI_hpp
#define cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "libhubtags/CLIArguments.hpp"


namespace hubtags {
namespace cli {

/**
 * Parses the global options (which set the logger level) and builds the command
 * object of the first positional argument. Without a command, or with --help,
 * the command is "help"; --version selects "version".
 */
class CLI {
public:
    CLI();
    std::unique_ptr<cli::Command> parseCommandLine(const libhubtags::CLIArguments&, std::shared_ptr<common::Config>) const;
    const boost::program_options::options_description& getOptionsDescription() const;

private:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif
