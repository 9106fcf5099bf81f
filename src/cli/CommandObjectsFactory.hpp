/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandObjectsFactory_hpp
#define cli_CommandObjectsFactory_hpp

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <map>

#include "common/Config.hpp"
#include "libhubtags/CLIArguments.hpp"
#include "cli/Command.hpp"


namespace hubtags {
namespace cli {

class CommandObjectsFactory {
public:
    CommandObjectsFactory();

    template<class CommandType>
    void addCommand(const std::string& commandName) {
        auto& makers = commands[commandName];
        makers.makeForHelp = []() {
            return std::unique_ptr<cli::Command>{new CommandType{}};
        };
        makers.make = [](const libhubtags::CLIArguments& commandArgs, std::shared_ptr<common::Config> config) {
            return std::unique_ptr<cli::Command>{new CommandType{commandArgs, std::move(config)}};
        };
    }

    bool isValidCommandName(const std::string& commandName) const;
    // sorted alphabetically
    std::vector<std::string> getCommandNames() const;
    // command object that only describes itself (brief description and help message)
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName) const;
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName,
                                                    const libhubtags::CLIArguments& commandArgs,
                                                    std::shared_ptr<common::Config> config) const;

private:
    struct Makers {
        std::function<std::unique_ptr<cli::Command>()> makeForHelp;
        std::function<std::unique_ptr<cli::Command>(const libhubtags::CLIArguments&,
                                                    std::shared_ptr<common::Config>)> make;
    };

    const Makers& findMakers(const std::string& commandName) const;

private:
    std::map<std::string, Makers> commands;
};

}
}

#endif
