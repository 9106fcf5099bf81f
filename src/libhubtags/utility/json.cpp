/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "json.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <boost/format.hpp>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>
#include <rapidjson/writer.h>

#include "libhubtags/Error.hpp"


namespace libhubtags {
namespace json {

static std::string readFile(const boost::filesystem::path& file) {
    std::ifstream ifs(file.string());
    if(!ifs) {
        auto message = boost::format("Failed to open JSON file %s") % file;
        HUBTAGS_THROW_ERROR(message.str());
    }
    std::ostringstream contents;
    contents << ifs.rdbuf();
    return contents.str();
}

rapidjson::Document parse(const std::string& text, const std::string& origin) {
    auto json = rapidjson::Document{};
    json.Parse(text.c_str(), text.size());
    if(json.HasParseError()) {
        const auto excerptLength = size_t{40};
        auto offset = std::min(json.GetErrorOffset(), text.size());
        auto message = boost::format(
            "Failed to parse JSON from %s: %s (offset %u, near '%s')")
            % origin
            % rapidjson::GetParseError_En(json.GetParseError())
            % offset
            % text.substr(offset, excerptLength);
        HUBTAGS_THROW_ERROR(message.str());
    }
    return json;
}

template<class Pointer>
static std::string stringify(const Pointer& pointer) {
    rapidjson::StringBuffer buffer;
    pointer.StringifyUriFragment(buffer);
    return buffer.GetString();
}

rapidjson::Document readAndValidate(const boost::filesystem::path& jsonFile, const boost::filesystem::path& schemaFile) {
    auto schemaJSON = parse(readFile(schemaFile), schemaFile.string());
    rapidjson::SchemaDocument schema(schemaJSON);
    auto json = parse(readFile(jsonFile), jsonFile.string());

    rapidjson::SchemaValidator validator(schema);
    if(!json.Accept(validator)) {
        rapidjson::StringBuffer report;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(report);
        validator.GetError().Accept(writer);

        auto message = boost::format(
            "JSON file %s does not conform to schema %s\n"
            "Invalid schema: %s\nInvalid keyword: %s\nInvalid document: %s\nError report:\n%s")
            % jsonFile % schemaFile
            % stringify(validator.GetInvalidSchemaPointer())
            % validator.GetInvalidSchemaKeyword()
            % stringify(validator.GetInvalidDocumentPointer())
            % report.GetString();
        HUBTAGS_THROW_ERROR(message.str());
    }

    return json;
}

std::string serialize(const rapidjson::Value& json) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    json.Accept(writer);
    return buffer.GetString();
}

}}
