/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_HelpMessage_hpp
#define cli_HelpMessage_hpp

#include <ostream>
#include <string>

#include <boost/program_options.hpp>


namespace hubtags {
namespace cli {

/**
 * Help text of a command: usage line, description and, if any, the options.
 * The options description is referenced, not copied, so it must outlive the message.
 */
class HelpMessage {
public:
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);

    void print(std::ostream&) const;

private:
    std::string usage;
    std::string description;
    const boost::program_options::options_description* optionsDescription = nullptr;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
