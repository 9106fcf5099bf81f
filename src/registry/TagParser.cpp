/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "TagParser.hpp"

#include <boost/format.hpp>

#include "libhubtags/Error.hpp"
#include "libhubtags/utility/json.hpp"
#include "common/Timestamp.hpp"

namespace rj = rapidjson;


namespace hubtags {
namespace registry {

static const rj::Value& getMember(const rj::Value& json, const char* name, const char* parent) {
    if(!json.IsObject()) {
        auto message = boost::format("Failed to parse %s: expected JSON object, got %s")
            % parent % libhubtags::json::serialize(json);
        HUBTAGS_THROW_ERROR(message.str());
    }
    auto it = json.FindMember(name);
    if(it == json.MemberEnd()) {
        auto message = boost::format("Failed to parse %s: missing field '%s'") % parent % name;
        HUBTAGS_THROW_ERROR(message.str());
    }
    return it->value;
}

static const rj::Value* findNonNullMember(const rj::Value& json, const char* name) {
    auto it = json.FindMember(name);
    if(it == json.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    return &it->value;
}

static std::string getString(const rj::Value& json, const char* name, const char* parent) {
    const auto& value = getMember(json, name, parent);
    if(!value.IsString()) {
        auto message = boost::format("Failed to parse %s: field '%s' is not a string") % parent % name;
        HUBTAGS_THROW_ERROR(message.str());
    }
    return value.GetString();
}

// absent and null mean the same
static boost::optional<std::string> getOptionalString(const rj::Value& json, const char* name, const char* parent) {
    const auto* value = findNonNullMember(json, name);
    if(value == nullptr) {
        return {};
    }
    if(!value->IsString()) {
        auto message = boost::format("Failed to parse %s: field '%s' is neither a string nor null") % parent % name;
        HUBTAGS_THROW_ERROR(message.str());
    }
    return std::string{ value->GetString() };
}

static common::Timestamp getTimestamp(const rj::Value& json, const char* name, const char* parent) {
    auto value = getOptionalString(json, name, parent);
    if(!value) {
        return common::EPOCH;
    }
    return common::parseTimestamp(*value);
}

TagPage TagParser::parsePage(const std::string& body, const std::string& origin) const {
    auto json = libhubtags::json::parse(body, origin);
    return parsePage(json);
}

TagPage TagParser::parsePage(const rj::Value& json) const {
    auto page = TagPage{};

    const auto& results = getMember(json, "results", "page of tags");
    if(!results.IsArray()) {
        HUBTAGS_THROW_ERROR("Failed to parse page of tags: field 'results' is not an array");
    }
    for(const auto& result : results.GetArray()) {
        page.tags.push_back(parseTag(result));
    }

    page.next = getOptionalString(json, "next", "page of tags");

    return page;
}

std::shared_ptr<tags::TagRecord> TagParser::parseTag(const rj::Value& json) const {
    auto name = getString(json, "name", "tag");

    try {
        auto tag = std::make_shared<tags::TagRecord>(
            name,
            getTimestamp(json, "last_updated", "tag"),
            getOptionalString(json, "tag_status", "tag").value_or(""));

        const auto& images = getMember(json, "images", "tag");
        if(!images.IsArray()) {
            HUBTAGS_THROW_ERROR("Failed to parse tag: field 'images' is not an array");
        }
        for(const auto& image : images.GetArray()) {
            tag->addImage(parseImage(image));
        }

        return tag;
    }
    catch(libhubtags::Error& e) {
        e.addContext("tag", name);
        auto message = boost::format("Failed to parse tag '%s'") % name;
        HUBTAGS_RETHROW_ERROR(e, message.str());
    }
}

tags::ImageRecord TagParser::parseImage(const rj::Value& json) const {
    auto image = tags::ImageRecord{};
    image.platform = tags::PlatformKey{
        getOptionalString(json, "architecture", "image"),
        getOptionalString(json, "features", "image"),
        getOptionalString(json, "variant", "image"),
        getOptionalString(json, "os", "image"),
        getOptionalString(json, "os_features", "image"),
        getOptionalString(json, "os_version", "image")
    };
    image.digest = getString(json, "digest", "image");
    image.status = getOptionalString(json, "status", "image").value_or("");
    image.lastUpdated = getTimestamp(json, "last_pushed", "image");
    return image;
}

}
}
