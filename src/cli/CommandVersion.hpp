/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandVersion_hpp
#define cli_CommandVersion_hpp

#include <memory>

#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libhubtags/CLIArguments.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace hubtags {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libhubtags::CLIArguments& args, std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {
        // empty when requested through the global option --version
        if(!args.getTokensAfterName().empty()) {
            utility::reportUsageError(boost::format("Command 'version' takes no options or arguments"
                                                    "\nSee 'hubtags help version'"));
        }
    }

    void execute() override {
        utility::printLog(conf->buildTime.version, libhubtags::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Show the hubtags version information";
    }

    void printHelpMessage(std::ostream& os) const override {
        os << cli::HelpMessage()
            .setUsage("hubtags version")
            .setDescription(getBriefDescription());
    }

private:
    std::shared_ptr<const common::Config> conf;
};

}
}

#endif
