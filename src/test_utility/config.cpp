/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include <fstream>
#include <utility>

#include <boost/format.hpp>

#include "libhubtags/Error.hpp"

namespace test_utility {
namespace config {

static const std::string DEFAULT_CONFIG_FILE_CONTENT = R"({
    "registryUrl": "https://registry.hub.docker.com/v2",
    "pageSize": 100,
    "defaultArchitecture": "amd64",
    "enforceSecureServer": true,
    "requestTimeoutSeconds": 30
})";

ConfigRAII::ConfigRAII(ConfigRAII&& rhs)
    : config{std::move(rhs.config)}
    , prefixDir{std::move(rhs.prefixDir)}
{
    rhs.prefixDir.clear();
}

ConfigRAII::~ConfigRAII() {
    if(!prefixDir.empty()) {
        boost::system::error_code ec;
        boost::filesystem::remove_all(prefixDir, ec);
    }
}

ConfigRAII makePrefixDir() {
    auto raii = ConfigRAII{};
    raii.prefixDir = boost::filesystem::temp_directory_path()
        / boost::filesystem::unique_path("hubtags-test-prefix-dir-%%%%-%%%%-%%%%");
    boost::filesystem::create_directories(raii.prefixDir / "etc");

    // JSON schema
    auto repoRootDir = boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
    boost::filesystem::copy_file(repoRootDir / "etc/hubtags.schema.json", raii.prefixDir / "etc/hubtags.schema.json");

    return raii;
}

void writeConfigFile(const boost::filesystem::path& prefixDir, const std::string& content) {
    auto file = prefixDir / "etc/hubtags.json";
    std::ofstream os{file.string()};
    if(!os) {
        auto message = boost::format("Failed to write test config file %s") % file;
        HUBTAGS_THROW_ERROR(message.str());
    }
    os << content;
}

ConfigRAII makeConfig(const std::string& configFileContent) {
    auto raii = makePrefixDir();
    writeConfigFile(raii.prefixDir, configFileContent);
    raii.config = std::make_shared<hubtags::common::Config>(raii.prefixDir);
    return raii;
}

ConfigRAII makeConfig() {
    return makeConfig(DEFAULT_CONFIG_FILE_CONTENT);
}

}
}
