/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "HelpMessage.hpp"


namespace hubtags {
namespace cli {

HelpMessage& HelpMessage::setUsage(const std::string& usage) {
    this->usage = usage;
    return *this;
}

HelpMessage& HelpMessage::setDescription(const std::string& description) {
    this->description = description;
    return *this;
}

HelpMessage& HelpMessage::setOptionsDescription(const boost::program_options::options_description& optionsDescription) {
    this->optionsDescription = &optionsDescription;
    return *this;
}

void HelpMessage::print(std::ostream& os) const {
    os << "Usage: " << usage << "\n\n" << description << "\n";
    if(optionsDescription != nullptr && !optionsDescription->options().empty()) {
        os << "\n" << *optionsDescription;
    }
}

std::ostream& operator<<(std::ostream& os, const HelpMessage& message) {
    message.print(os);
    return os;
}

}
}
