/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <boost/format.hpp>

#include "libhubtags/Error.hpp"


namespace libhubtags {
namespace environment {

std::unordered_map<std::string, std::string> parseVariables(char** env) {
    auto map = std::unordered_map<std::string, std::string>{};
    for(size_t i=0; env[i] != nullptr; ++i) {
        auto variable = std::string{env[i]};
        auto separator = variable.find('=');
        auto name = variable.substr(0, separator);
        if(name.empty()) {
            auto message = boost::format("Failed to parse environment variable '%s': name is empty") % variable;
            HUBTAGS_THROW_ERROR(message.str());
        }
        map[name] = separator == std::string::npos ? std::string{} : variable.substr(separator + 1);
    }
    return map;
}

}}
