/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_registry_TagParser_hpp
#define hubtags_registry_TagParser_hpp

#include <string>
#include <memory>

#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "tags/TagRecord.hpp"


namespace hubtags {
namespace registry {

/**
 * One page of the tags listing of a repository.
 */
struct TagPage {
    tags::TagRecords tags;
    boost::optional<std::string> next; // URL of the following page, if any
};

/**
 * Converts the JSON documents returned by the Docker Hub's tags endpoint
 * (/v2/repositories/<namespace>/<image>/tags) into tag records.
 */
class TagParser {
public:
    // origin names the source of the body (e.g. its URL) in error messages
    TagPage parsePage(const std::string& body, const std::string& origin = "registry response") const;
    TagPage parsePage(const rapidjson::Value& json) const;
    std::shared_ptr<tags::TagRecord> parseTag(const rapidjson::Value& json) const;
    tags::ImageRecord parseImage(const rapidjson::Value& json) const;
};

}
}

#endif
