/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandHelp_hpp
#define cli_CommandHelp_hpp

#include <iostream>
#include <memory>
#include <string>
#include <tuple>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "common/Config.hpp"
#include "libhubtags/CLIArguments.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/CLI.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/CommandObjectsFactory.hpp"

namespace hubtags {
namespace cli {

/**
 * "hubtags help" lists the global options and the commands,
 * "hubtags help COMMAND" prints the help message of COMMAND.
 */
class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libhubtags::CLIArguments& args, std::shared_ptr<common::Config>) {
        parseCommandArguments(args);
    }

    void execute() override {
        auto factory = CommandObjectsFactory{};
        if(commandName) {
            factory.makeCommandObject(*commandName)->printHelpMessage(std::cout);
            return;
        }

        std::cout << "Usage: hubtags [OPTIONS] COMMAND\n"
                  << "\n"
                  << cli::CLI{}.getOptionsDescription()
                  << "\n"
                  << "Commands:\n";
        for(const auto& name : factory.getCommandNames()) {
            std::cout << boost::format("   %-10s%s\n") % name % factory.makeCommandObject(name)->getBriefDescription();
        }
        std::cout << "\nSee 'hubtags help COMMAND' for the help message of a command\n";
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage(std::ostream& os) const override {
        os << cli::HelpMessage()
            .setUsage("hubtags help [COMMAND]")
            .setDescription(getBriefDescription());
    }

private:
    void parseCommandArguments(const libhubtags::CLIArguments& args) {
        if(args.empty()) { // from the global option --help
            return;
        }

        libhubtags::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(
            args, boost::program_options::options_description{});

        if(nameAndOptionArgs.argc() > 1) {
            utility::reportUsageError(boost::format("Command 'help' doesn't support options\nSee 'hubtags help help'"));
        }
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 1, "help");

        if(!positionalArgs.empty()) {
            auto name = positionalArgs.getName();
            if(!CommandObjectsFactory{}.isValidCommandName(name)) {
                utility::reportUsageError(boost::format("'%s' is not a hubtags command\nSee 'hubtags help'") % name);
            }
            commandName = name;
        }
    }

private:
    boost::optional<std::string> commandName;
};

}
}

#endif
