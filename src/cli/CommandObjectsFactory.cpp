/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CommandObjectsFactory.hpp"

#include <boost/format.hpp>

#include "cli/Utility.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandTags.hpp"
#include "cli/CommandVersion.hpp"


namespace hubtags {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandTags>("tags");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return commands.find(commandName) != commands.cend();
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    for(const auto& command : commands) {
        names.push_back(command.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    return findMakers(commandName).makeForHelp();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libhubtags::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    return findMakers(commandName).make(commandArgs, std::move(config));
}

const CommandObjectsFactory::Makers& CommandObjectsFactory::findMakers(const std::string& commandName) const {
    auto it = commands.find(commandName);
    if(it == commands.cend()) {
        utility::reportUsageError(boost::format("'%s' is not a hubtags command\nSee 'hubtags help'") % commandName);
    }
    return it->second;
}

}
}
