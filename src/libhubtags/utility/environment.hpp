/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhubtags_utility_environment_hpp
#define libhubtags_utility_environment_hpp

#include <string>
#include <unordered_map>


namespace libhubtags {
namespace environment {

/**
 * Parses a null-terminated array of NAME=VALUE strings (e.g. environ).
 * A variable without '=' maps to an empty value. Later duplicates win.
 */
std::unordered_map<std::string, std::string> parseVariables(char** env);

}}

#endif
