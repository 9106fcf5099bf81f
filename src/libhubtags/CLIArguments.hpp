/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhubtags_CLIArguments_hpp
#define libhubtags_CLIArguments_hpp

#include <initializer_list>
#include <vector>
#include <string>
#include <ostream>

namespace libhubtags {

/**
 * The command line of the program (or of one of its subcommands): the name
 * followed by the option and positional tokens.
 */
class CLIArguments {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

public:
    CLIArguments() = default;
    CLIArguments(int argc, char* argv[]);
    CLIArguments(std::initializer_list<std::string> args);
    template<class InputIter>
    CLIArguments(InputIter begin, InputIter end) : args(begin, end) {}

    void push_back(const std::string& arg);

    int argc() const;
    bool empty() const;

    // first token, e.g. "hubtags" or "tags"
    const std::string& getName() const;
    // tokens in the form expected by boost::program_options::command_line_parser
    std::vector<std::string> getTokensAfterName() const;

    const_iterator begin() const;
    const_iterator end() const;

private:
    std::vector<std::string> args;
};

std::ostream& operator<<(std::ostream&, const CLIArguments&);

}

#endif
