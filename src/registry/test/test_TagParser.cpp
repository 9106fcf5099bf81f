/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>

#include "registry/TagParser.hpp"
#include "common/Timestamp.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace hubtags {
namespace registry {
namespace test {

TEST_GROUP(TagParserTestGroup) {
};

static const std::string page = R"({
    "count": 3,
    "next": "https://registry.hub.docker.com/v2/repositories/library/alpine/tags?page=2&page_size=2",
    "previous": null,
    "results": [
        {
            "name": "3.18",
            "last_updated": "2023-08-07T20:15:31.145213Z",
            "tag_status": "active",
            "images": [
                {
                    "architecture": "amd64",
                    "features": "",
                    "variant": null,
                    "digest": "sha256:c5c5fda71656f28e49ac9c5416b3643eaa6a108a8093151d6d1afc9463be8e33",
                    "os": "linux",
                    "os_features": "",
                    "os_version": null,
                    "size": 3397879,
                    "status": "active",
                    "last_pulled": "2023-09-01T10:00:00.000000Z",
                    "last_pushed": "2023-08-07T19:20:20.894140Z"
                },
                {
                    "architecture": "arm",
                    "variant": "v7",
                    "digest": "sha256:f5e0a3b7ac8cbea7d4ac4bab9be3bd1e5e3e1e4d29b5b5d7e9f6e4f47e1e2d3c",
                    "os": "linux",
                    "status": "active"
                }
            ]
        },
        {
            "name": "edge",
            "last_updated": null,
            "images": []
        }
    ]
})";

TEST(TagParserTestGroup, page) {
    auto parsed = TagParser{}.parsePage(page);

    CHECK(parsed.next);
    CHECK_EQUAL(*parsed.next, std::string{"https://registry.hub.docker.com/v2/repositories/library/alpine/tags?page=2&page_size=2"});
    CHECK_EQUAL(parsed.tags.size(), 2);

    const auto& tag = *parsed.tags[0];
    CHECK_EQUAL(tag.getName(), std::string{"3.18"});
    CHECK_EQUAL(tag.getStatus(), std::string{"active"});
    CHECK(tag.getLastUpdated() == common::parseTimestamp("2023-08-07T20:15:31.145213Z"));
    CHECK_EQUAL(tag.getImages().size(), 2);

    const auto& amd64 = tag.getImages()[0];
    CHECK(amd64.tag == &tag);
    CHECK(amd64.platform == (tags::PlatformKey{std::string{"amd64"}, std::string{}, boost::none,
                                               std::string{"linux"}, std::string{}, boost::none}));
    CHECK_EQUAL(amd64.digest, std::string{"sha256:c5c5fda71656f28e49ac9c5416b3643eaa6a108a8093151d6d1afc9463be8e33"});
    CHECK_EQUAL(amd64.status, std::string{"active"});
    CHECK(amd64.lastUpdated == common::parseTimestamp("2023-08-07T19:20:20.894140Z"));

    const auto& arm = tag.getImages()[1];
    CHECK(arm.platform == (tags::PlatformKey{std::string{"arm"}, boost::none, std::string{"v7"},
                                             std::string{"linux"}, boost::none, boost::none}));
    CHECK(arm.lastUpdated == common::EPOCH);

    const auto& edge = *parsed.tags[1];
    CHECK_EQUAL(edge.getName(), std::string{"edge"});
    CHECK(edge.getLastUpdated() == common::EPOCH);
    CHECK(edge.getStatus().empty());
    CHECK(edge.getImages().empty());
}

TEST(TagParserTestGroup, lastPage) {
    auto parsed = TagParser{}.parsePage(std::string{R"({"next": null, "results": []})"});
    CHECK(!parsed.next);
    CHECK(parsed.tags.empty());

    parsed = TagParser{}.parsePage(std::string{R"({"results": []})"});
    CHECK(!parsed.next);
}

TEST(TagParserTestGroup, invalidPages) {
    auto parser = TagParser{};
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{"not json"}));
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{"[]"}));
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{R"({"next": null})"}));
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{R"({"results": {}})"}));
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{R"({"results": [], "next": 2})"}));
}

TEST(TagParserTestGroup, invalidTags) {
    auto parser = TagParser{};
    // missing name
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{R"({"results": [{"images": []}]})"}));
    // missing images
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{R"({"results": [{"name": "1.0"}]})"}));
    // image without digest
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{
        R"({"results": [{"name": "1.0", "images": [{"architecture": "amd64"}]}]})"}));
    // malformed timestamp
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{
        R"({"results": [{"name": "1.0", "last_updated": "yesterday", "images": []}]})"}));
    // platform field of the wrong type
    CHECK_THROWS(libhubtags::Error, parser.parsePage(std::string{
        R"({"results": [{"name": "1.0", "images": [{"digest": "sha256:a", "architecture": 64}]}]})"}));
}

TEST(TagParserTestGroup, errorTraceNamesTheTag) {
    try {
        TagParser{}.parsePage(std::string{R"({"results": [{"name": "broken", "images": [{}]}]})"});
        FAIL("Expected exception");
    }
    catch(const libhubtags::Error& e) {
        const auto& trace = e.getTrace();
        CHECK(trace.size() >= 2);
        CHECK_EQUAL(trace.back().errorMessage, std::string{"Failed to parse tag 'broken'"});
        CHECK_EQUAL(*e.getContext("tag"), std::string{"broken"});
    }
}

}
}
}

HUBTAGS_UNITTEST_MAIN_FUNCTION();
