/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include "libhubtags/Error.hpp"
#include "libhubtags/utility/json.hpp"


namespace hubtags {
namespace common {

const std::string Config::DEFAULT_REGISTRY_URL{"https://registry.hub.docker.com/v2"};
const int Config::DEFAULT_PAGE_SIZE = 100;
const std::string Config::DEFAULT_ARCHITECTURE{"amd64"};
const int Config::DEFAULT_REQUEST_TIMEOUT_SECONDS = 30;

Config::Config(const boost::filesystem::path& installationPrefixDir)
    : Config{installationPrefixDir / "etc/hubtags.json", installationPrefixDir / "etc/hubtags.schema.json"}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libhubtags::json::readAndValidate(configFilename, configSchemaFilename) }
{}

// The schema documents the defaults, but RapidJSON's validator doesn't fill them in

std::string Config::getRegistryUrl() const {
    if(!json.HasMember("registryUrl")) {
        return DEFAULT_REGISTRY_URL;
    }
    auto url = std::string{ json["registryUrl"].GetString() };
    while(!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

int Config::getPageSize() const {
    if(!json.HasMember("pageSize")) {
        return DEFAULT_PAGE_SIZE;
    }
    return json["pageSize"].GetInt();
}

std::string Config::getDefaultArchitecture() const {
    if(!json.HasMember("defaultArchitecture")) {
        return DEFAULT_ARCHITECTURE;
    }
    return json["defaultArchitecture"].GetString();
}

bool Config::isSecureServerEnforced() const {
    if(!json.HasMember("enforceSecureServer")) {
        return true;
    }
    return json["enforceSecureServer"].GetBool();
}

std::chrono::seconds Config::getRequestTimeout() const {
    if(!json.HasMember("requestTimeoutSeconds")) {
        return std::chrono::seconds{DEFAULT_REQUEST_TIMEOUT_SECONDS};
    }
    return std::chrono::seconds{json["requestTimeoutSeconds"].GetInt()};
}

/**
 * The architecture selected through the CLI, or the configured default.
 */
std::string Config::getArchitecture() const {
    if(commandTags.architecture) {
        return *commandTags.architecture;
    }
    return getDefaultArchitecture();
}

}} // namespaces
