/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <boost/format.hpp>

#include "libhubtags/Error.hpp"

namespace libhubtags {

CLIArguments::CLIArguments(int argc, char* argv[])
    : args(argv, argv + argc)
{}

CLIArguments::CLIArguments(std::initializer_list<std::string> args)
    : args(args)
{}

void CLIArguments::push_back(const std::string& arg) {
    args.push_back(arg);
}

int CLIArguments::argc() const {
    return static_cast<int>(args.size());
}

bool CLIArguments::empty() const {
    return args.empty();
}

const std::string& CLIArguments::getName() const {
    if(args.empty()) {
        HUBTAGS_THROW_ERROR("Failed to get name of command line: there are no arguments");
    }
    return args.front();
}

std::vector<std::string> CLIArguments::getTokensAfterName() const {
    if(args.empty()) {
        return {};
    }
    return std::vector<std::string>(args.cbegin() + 1, args.cend());
}

CLIArguments::const_iterator CLIArguments::begin() const {
    return args.cbegin();
}

CLIArguments::const_iterator CLIArguments::end() const {
    return args.cend();
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    os << "[";
    auto separator = "";
    for(const auto& arg : args) {
        os << separator << boost::format("\"%s\"") % arg;
        separator = ", ";
    }
    os << "]";
    return os;
}

}
