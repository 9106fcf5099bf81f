/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_common_Config_hpp
#define hubtags_common_Config_hpp

#include <string>
#include <unordered_map>
#include <chrono>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "common/RepositoryReference.hpp"


namespace hubtags {
namespace common {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        Config(const boost::filesystem::path& installationPrefixDir);

        struct BuildTime {
            BuildTime();
            std::string version;
        };

        struct CommandTags {
            RepositoryReference repository;
            boost::optional<std::string> architecture;
        };

        std::string getRegistryUrl() const;
        int getPageSize() const;
        std::string getDefaultArchitecture() const;
        bool isSecureServerEnforced() const;
        std::chrono::seconds getRequestTimeout() const;
        std::string getArchitecture() const;

        BuildTime buildTime;
        rapidjson::Document json{ rapidjson::kObjectType };
        std::unordered_map<std::string, std::string> hostEnvironment;
        CommandTags commandTags;

        static const std::string DEFAULT_REGISTRY_URL;
        static const int DEFAULT_PAGE_SIZE;
        static const std::string DEFAULT_ARCHITECTURE;
        static const int DEFAULT_REQUEST_TIMEOUT_SECONDS;
};

}
}

#endif
