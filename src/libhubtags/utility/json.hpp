/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhubtags_utility_json_hpp
#define libhubtags_utility_json_hpp

#include <string>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

/**
 * Utility functions for JSON operations
 */

namespace libhubtags {
namespace json {

/**
 * Parses a JSON text. The origin (e.g. the URL of a registry page) only appears
 * in the error message.
 */
rapidjson::Document parse(const std::string& text, const std::string& origin);

/**
 * Reads a JSON file and validates it against a JSON schema file.
 */
rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile,
                                    const boost::filesystem::path& schemaFile);

std::string serialize(const rapidjson::Value& json);

}}

#endif
