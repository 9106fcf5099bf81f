/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <vector>


namespace hubtags {
namespace cli {
namespace utility {

namespace po = boost::program_options;

static bool isShortOption(const std::string& token) {
    return token.size() > 1 && token[0] == '-' && token[1] != '-';
}

static bool isLongOption(const std::string& token) {
    return token.size() > 2 && token.compare(0, 2, "--") == 0 && token[2] != '-';
}

static bool isOption(const std::string& token) {
    return isShortOption(token) || isLongOption(token);
}

static bool takesValue(const po::option_description& option) {
    return option.semantic()->max_tokens() > 0;
}

// whether the option token leaves its value to the following token
static bool expectsSeparateValue(const std::string& token, const po::options_description& optionsDescription) {
    if(isLongOption(token)) {
        if(token.find('=') != std::string::npos) {
            return false;
        }
        const auto* option = optionsDescription.find_nothrow(token.substr(2), false);
        return option != nullptr && takesValue(*option);
    }

    // grouped short options ("-vq"): the first one taking a value ends the group
    // and has its value attached ("-aarm64") unless it is the last character
    for(size_t i=1; i<token.size(); ++i) {
        const auto* option = optionsDescription.find_nothrow(std::string{"-"} + token[i], false);
        if(option == nullptr) {
            return false;
        }
        if(takesValue(*option)) {
            return i == token.size()-1;
        }
    }
    return false;
}

std::tuple<libhubtags::CLIArguments, libhubtags::CLIArguments> groupOptionsAndPositionalArguments(
        const libhubtags::CLIArguments& args,
        const po::options_description& optionsDescription) {
    auto nameAndOptionArgs = libhubtags::CLIArguments{};
    if(args.empty()) {
        return std::make_tuple(nameAndOptionArgs, libhubtags::CLIArguments{});
    }

    nameAndOptionArgs.push_back(args.getName());

    auto tokens = args.getTokensAfterName();
    auto token = tokens.cbegin();
    while(token != tokens.cend() && isOption(*token)) {
        nameAndOptionArgs.push_back(*token);
        auto next = token + 1;
        if(next != tokens.cend() && !isOption(*next) && expectsSeparateValue(*token, optionsDescription)) {
            nameAndOptionArgs.push_back(*next);
            ++next;
        }
        token = next;
    }

    return std::make_tuple(nameAndOptionArgs, libhubtags::CLIArguments(token, tokens.cend()));
}

po::variables_map parseOptions(const libhubtags::CLIArguments& nameAndOptionArgs,
        const po::options_description& optionsDescription, const std::string& command) {
    auto values = po::variables_map{};
    auto parser = po::command_line_parser(nameAndOptionArgs.getTokensAfterName());
    parser.options(optionsDescription).style(po::command_line_style::unix_style);
    try {
        po::store(parser.run(), values);
        po::notify(values);
    }
    catch(const po::error& e) {
        auto helpCommand = command.empty() ? std::string{"hubtags help"} : "hubtags help " + command;
        reportUsageError(boost::format("%s\nSee '%s'") % e.what() % helpCommand);
    }
    return values;
}

void validateNumberOfPositionalArguments(const libhubtags::CLIArguments& positionalArgs, int min, int max,
        const std::string& command) {
    auto count = positionalArgs.argc();
    if(count < min || count > max) {
        auto message = boost::format("Too %s arguments for command '%s'\nSee 'hubtags help %s'")
            % (count < min ? "few" : "many") % command % command;
        reportUsageError(message);
    }
}

void reportUsageError(const boost::format& message) {
    printLog(message, libhubtags::LogLevel::GENERAL, std::cerr);
    HUBTAGS_THROW_ERROR(message.str(), libhubtags::LogLevel::INFO);
}

void printLog(const std::string& message, libhubtags::LogLevel logLevel,
              std::ostream& generalStream, std::ostream& diagnosticStream) {
    libhubtags::Logger::getInstance().log(message, "CLI", logLevel, generalStream, diagnosticStream);
}

void printLog(const boost::format& message, libhubtags::LogLevel logLevel,
              std::ostream& generalStream, std::ostream& diagnosticStream) {
    printLog(message.str(), logLevel, generalStream, diagnosticStream);
}

} // namespace
} // namespace
} // namespace
