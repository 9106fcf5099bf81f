/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLI.hpp"

#include <string>
#include <tuple>

#include <boost/format.hpp>

#include "libhubtags/Logger.hpp"
#include "cli/Utility.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace hubtags {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print this help and exit")
        ("version", "Print the hubtags version and exit")
        ("verbose", "Log messages of level INFO and above on stderr")
        ("debug", "Log messages of level DEBUG and above on stderr (implies --verbose)");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libhubtags::CLIArguments& args, std::shared_ptr<common::Config> conf) const {
    libhubtags::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

    auto values = cli::utility::parseOptions(nameAndOptionArgs, optionsDescription, "");

    auto level = values.count("debug") ? libhubtags::LogLevel::DEBUG
               : values.count("verbose") ? libhubtags::LogLevel::INFO
               : libhubtags::LogLevel::WARN;
    libhubtags::Logger::getInstance().setLevel(level);
    utility::printLog(boost::format("command line: %s") % args, libhubtags::LogLevel::DEBUG);

    // --help and --version override the command, which defaults to help
    auto overridingCommand = values.count("help") ? "help"
                           : values.count("version") ? "version"
                           : positionalArgs.empty() ? "help"
                           : nullptr;
    if(overridingCommand != nullptr) {
        return CommandObjectsFactory{}.makeCommandObject(overridingCommand, libhubtags::CLIArguments{}, std::move(conf));
    }
    return CommandObjectsFactory{}.makeCommandObject(positionalArgs.getName(), positionalArgs, std::move(conf));
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

} // namespace
} // namespace
