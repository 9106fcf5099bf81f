/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_CommandTags_hpp
#define cli_CommandTags_hpp

#include <iostream>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "common/RepositoryReference.hpp"
#include "libhubtags/CLIArguments.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "registry/HubClient.hpp"
#include "tags/ImageGrouper.hpp"
#include "tags/TagSummary.hpp"


namespace hubtags {
namespace cli {

class CommandTags : public Command {
public:
    CommandTags() {
        initializeOptionsDescription();
    }

    CommandTags(const libhubtags::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto repository = conf->commandTags.repository.getFullName();
        auto architecture = conf->getArchitecture();
        auto lines = std::vector<tags::SummaryLine>{};

        try {
            registry::HubClient client{conf};
            auto records = client.retrieveTags();
            auto images = tags::groupImages(records);
            lines = tags::summarize(images, architecture);
        }
        catch(libhubtags::Error& e) {
            e.addContext("repository", repository).addContext("architecture", architecture);
            auto message = boost::format("Failed to list the tags of repository %s") % repository;
            HUBTAGS_RETHROW_ERROR(e, message.str());
        }

        if(lines.empty()) {
            auto message = boost::format("No images of architecture %s in repository %s") % architecture % repository;
            utility::printLog(message, libhubtags::LogLevel::WARN);
        }
        for(const auto& line : lines) {
            utility::printLog(line.string(), libhubtags::LogLevel::GENERAL);
        }
    }

    std::string getBriefDescription() const override {
        return "List the images of a repository with their tags, most relevant first";
    }

    void printHelpMessage(std::ostream& os) const override {
        os << cli::HelpMessage()
            .setUsage("hubtags tags [OPTIONS] REPOSITORY")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription);
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("architecture,a",
                boost::program_options::value<std::string>(),
                "Architecture of the images to list (default from configuration, usually amd64)");
    }

    void parseCommandArguments(const libhubtags::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of tags command: %s") % args, libhubtags::LogLevel::DEBUG);

        libhubtags::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "tags");

        auto values = cli::utility::parseOptions(nameAndOptionArgs, optionsDescription, "tags");

        if(values.count("architecture")) {
            auto architecture = values["architecture"].as<std::string>();
            if(architecture.empty()) {
                utility::reportUsageError(boost::format("The argument for option '--architecture' is empty"
                                                        "\nSee 'hubtags help tags'"));
            }
            conf->commandTags.architecture = architecture;
        }

        conf->commandTags.repository = common::RepositoryReference::parse(*positionalArgs.begin());

        cli::utility::printLog(boost::format("selected repository %s, architecture %s")
                               % conf->commandTags.repository % conf->getArchitecture(), libhubtags::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
};

}
}

#endif
