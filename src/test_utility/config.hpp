/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef hubtags_test_utility_config_hpp
#define hubtags_test_utility_config_hpp

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

/**
 * An installation prefix in a temporary directory, with the JSON schema of the
 * configuration in place. The directory is removed on destruction.
 */
struct ConfigRAII {
    ConfigRAII() = default;
    ConfigRAII(ConfigRAII&& rhs);
    ~ConfigRAII();
    std::shared_ptr<hubtags::common::Config> config;
    boost::filesystem::path prefixDir;
};

ConfigRAII makeConfig();
ConfigRAII makeConfig(const std::string& configFileContent);
ConfigRAII makePrefixDir();
void writeConfigFile(const boost::filesystem::path& prefixDir, const std::string& content);

}
}

#endif
