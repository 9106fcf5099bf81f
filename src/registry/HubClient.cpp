/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "HubClient.hpp"

#include <initializer_list>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "libhubtags/Error.hpp"

using namespace web::http;                  // Common HTTP functionality


namespace hubtags {
namespace registry {

    HubClient::HubClient(std::shared_ptr<const common::Config> config)
        : config{std::move(config)}
        , pageGetter{[this](const std::string& url) { return getPage(url); }}
    {}

    HubClient::HubClient(std::shared_ptr<const common::Config> config, PageGetter pageGetter)
        : config{std::move(config)}
        , pageGetter{std::move(pageGetter)}
    {}

    /**
     * Retrieve all the pages of the tags listing, starting from the first one
     * and following the "next" links until a page without successor
     */
    tags::TagRecords HubClient::retrieveTags() {
        printLog(boost::format("Retrieving tags of repository %s") % config->commandTags.repository,
                 libhubtags::LogLevel::INFO);

        auto records = tags::TagRecords{};
        auto visitedUrls = std::unordered_set<std::string>{};
        auto url = boost::optional<std::string>{ makeTagsUrl() };

        while(url) {
            if(!visitedUrls.insert(*url).second) {
                auto message = boost::format("Failed to retrieve tags of repository %s."
                                             " The registry returned twice the page %s")
                    % config->commandTags.repository % *url;
                HUBTAGS_THROW_ERROR(message.str());
            }

            printLog(boost::format("Retrieving page %s") % *url, libhubtags::LogLevel::DEBUG);

            auto page = TagPage{};
            try {
                page = parser.parsePage(pageGetter(*url), *url);
            }
            catch(libhubtags::Error& e) {
                e.addContext("page", *url)
                 .addContext("repository", config->commandTags.repository.getFullName());
                auto message = boost::format("Failed to retrieve page %s") % *url;
                HUBTAGS_RETHROW_ERROR(e, message.str());
            }

            printLog(boost::format("Retrieved %d tags") % page.tags.size(), libhubtags::LogLevel::DEBUG);
            records.insert(records.end(), page.tags.cbegin(), page.tags.cend());
            url = page.next;
        }

        printLog(boost::format("Successfully retrieved %d tags of repository %s")
                 % records.size() % config->commandTags.repository,
                 libhubtags::LogLevel::INFO);

        return records;
    }

    std::string HubClient::makeTagsUrl() const {
        return (boost::format("%s/repositories/%s/tags?page_size=%d")
                % config->getRegistryUrl()
                % config->commandTags.repository.getFullName()
                % config->getPageSize()).str();
    }

    std::string HubClient::getPage(const std::string& url) const {
        auto uri = web::uri{};
        try {
            uri = web::uri{ U(url) };
        }
        catch(const std::exception& e) {
            auto message = boost::format("Invalid URL %s") % url;
            HUBTAGS_RETHROW_ERROR(e, message.str());
        }

        auto client = setupHttpClient(uri.authority());
        web::http::http_request  request(methods::GET);
        web::http::http_response response;

        request.set_request_uri(uri.resource());

        try {
            response = client->request(request).get();
        }
        catch(const std::exception& e) {
            auto message = boost::format("Error while sending request %s to remote registry") % url;
            HUBTAGS_RETHROW_ERROR(e, message.str());
        }

        printLog(boost::format("Received http_response status code(%s): %s")
                 % response.status_code() % response.reason_phrase(),
                 libhubtags::LogLevel::DEBUG);

        if(response.status_code() == status_codes::NotFound) {
            auto message = boost::format("Failed to retrieve tags of repository '%s'"
                                         "\nThe repository is not present in the remote registry.")
                % config->commandTags.repository;
            printLog(message, libhubtags::LogLevel::GENERAL, std::cerr);
            HUBTAGS_THROW_ERROR(message.str(), libhubtags::LogLevel::INFO);
        }
        if(response.status_code() != status_codes::OK) {
            auto message = boost::format("Unexpected response from remote registry."
                                         " Received http_response status code(%s): %s")
                % response.status_code() % response.reason_phrase();
            HUBTAGS_THROW_ERROR(message.str());
        }

        try {
            return response.extract_string(true).get();
        }
        catch(const std::exception& e) {
            HUBTAGS_RETHROW_ERROR(e, "Error while reading response body from remote registry");
        }
    }

    std::unique_ptr<web::http::client::http_client> HubClient::setupHttpClient(const web::uri& server) const {
        web::http::client::http_client_config clientConfig;
        clientConfig.set_validate_certificates(config->isSecureServerEnforced());
        clientConfig.set_timeout(config->getRequestTimeout());
        setProxyIfNecessary(clientConfig);

        return std::unique_ptr<web::http::client::http_client>( new web::http::client::http_client( server, clientConfig ));
    }

    void HubClient::setProxyIfNecessary(web::http::client::http_client_config& clientConfig) const {
        auto proxyURI = getProxy();
        if (!proxyURI.empty()) {
            printLog( boost::format("Setting proxy for HTTP client: %s") % proxyURI, libhubtags::LogLevel::DEBUG);
            clientConfig.set_proxy(web::web_proxy(proxyURI));
        }
    }

    // value of the first variable in the list that is set and not empty
    static boost::optional<std::string> findFirstSetVariable(
            const std::unordered_map<std::string, std::string>& environment,
            std::initializer_list<const char*> names) {
        for(const auto* name : names) {
            auto it = environment.find(name);
            if(it != environment.end() && !it->second.empty()) {
                return it->second;
            }
        }
        return {};
    }

    /**
     * Proxy for the registry as selected by the host environment. Lower case names
     * take precedence, as with curl. HTTP_PROXY is never honoured because CGI
     * environments let clients set it through the Proxy header.
     */
    std::string HubClient::getProxy() const {
        const auto& environment = config->hostEnvironment;

        auto noProxy = findFirstSetVariable(environment, {"no_proxy", "NO_PROXY"});
        if(noProxy && isRegistryInNoProxyList(*noProxy)) {
            return std::string{};
        }

        auto proxy = config->isSecureServerEnforced()
            ? findFirstSetVariable(environment, {"ALL_PROXY", "https_proxy", "HTTPS_PROXY"})
            : findFirstSetVariable(environment, {"ALL_PROXY", "http_proxy"});
        return proxy.value_or(std::string{});
    }

    bool HubClient::isRegistryInNoProxyList(const std::string& noProxyList) const {
        if (noProxyList == "*") {
            return true;
        }
        auto registryHost = getRegistryHost();
        auto hostnames = std::vector<std::string>{};
        boost::split(hostnames, noProxyList, boost::is_any_of(","));
        for (const auto& host : hostnames) {
            if (boost::trim_copy(host) == registryHost) {
                return true;
            }
        }
        return false;
    }

    std::string HubClient::getRegistryHost() const {
        try {
            return web::uri{ U(config->getRegistryUrl()) }.host();
        }
        catch(const std::exception& e) {
            auto message = boost::format("Invalid registry URL %s") % config->getRegistryUrl();
            HUBTAGS_RETHROW_ERROR(e, message.str());
        }
    }

    void HubClient::printLog(const boost::format &message, libhubtags::LogLevel logLevel,
                             std::ostream& outStream, std::ostream& errStream) const {
        libhubtags::Logger::getInstance().log(message, sysname, logLevel, outStream, errStream);
    }

} // namespace
} // namespace
