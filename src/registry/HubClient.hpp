/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_registry_HubClient_hpp
#define hubtags_registry_HubClient_hpp

#include <memory>
#include <string>
#include <functional>

#include <cpprest/http_client.h>
#include <boost/format.hpp>

#include "libhubtags/Logger.hpp"
#include "common/Config.hpp"
#include "tags/TagRecord.hpp"
#include "registry/TagParser.hpp"


namespace hubtags {
namespace registry {

/**
 * Retrieves the tags of the repository selected in the configuration, following
 * the pagination of the Docker Hub until the last page.
 */
class HubClient {
public:
    // returns the body of the document at the given URL
    using PageGetter = std::function<std::string(const std::string& url)>;

    HubClient(std::shared_ptr<const common::Config> config);
    HubClient(std::shared_ptr<const common::Config> config, PageGetter pageGetter);
    HubClient(const HubClient&) = delete;
    HubClient& operator=(const HubClient&) = delete;

    tags::TagRecords retrieveTags();
    std::string makeTagsUrl() const;
    std::string getProxy() const;

private:
    std::string getPage(const std::string& url) const;
    std::unique_ptr<web::http::client::http_client> setupHttpClient(const web::uri& server) const;
    void setProxyIfNecessary(web::http::client::http_client_config& clientConfig) const;
    bool isRegistryInNoProxyList(const std::string& noProxyList) const;
    std::string getRegistryHost() const;
    void printLog(const boost::format& message, libhubtags::LogLevel logLevel,
                  std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    PageGetter pageGetter;
    TagParser parser;

    /** system name for logger */
    const std::string sysname = "HubClient";
};

}
}

#endif
