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
#include <vector>
#include <sstream>

#include "tags/TagSummary.hpp"
#include "tags/test/records.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace hubtags {
namespace tags {
namespace test {

TEST_GROUP(TagSummaryTestGroup) {
};

static std::vector<std::string> toStrings(const std::vector<SummaryLine>& lines) {
    auto strings = std::vector<std::string>{};
    for(const auto& line : lines) {
        strings.push_back(line.string());
    }
    return strings;
}

TEST(TagSummaryTestGroup, singlePlatform) {
    auto tags = TagRecords{
        makeTag("latest", "sha256:new", {makePlatform("amd64")}, makeTimestamp("2023-05-01T10:00:00Z")),
        makeTag("2", "sha256:new", {makePlatform("amd64")}, makeTimestamp("2023-05-01T09:00:00Z")),
        makeTag("2.1", "sha256:new", {makePlatform("amd64")}, makeTimestamp("2023-05-01T09:00:00Z")),
        makeTag("1.9", "sha256:old", {makePlatform("amd64")}, makeTimestamp("2022-02-03T04:05:06Z")),
        makeTag("1.9.7", "sha256:old", {makePlatform("amd64")}, makeTimestamp("2022-02-03T04:05:06Z"))
    };
    auto lines = summarize(groupImages(tags), "amd64");

    CHECK((toStrings(lines) == std::vector<std::string>{
        "2023-05-01 10:00:00 UTC\t2, 2.1, latest",
        "2022-02-03 04:05:06 UTC\t1.9, 1.9.7"
    }));
}

TEST(TagSummaryTestGroup, otherArchitecturesAreSkipped) {
    auto noArchitecture = PlatformKey{boost::none, boost::none, boost::none, std::string{"linux"}, boost::none, boost::none};
    auto tags = TagRecords{
        makeTag("1.0", "sha256:a", {makePlatform("amd64"), makePlatform("arm64"), noArchitecture},
                makeTimestamp("2020-01-01T00:00:00Z")),
        makeTag("0.9", "sha256:b", {makePlatform("arm64")}, makeTimestamp("2019-01-01T00:00:00Z"))
    };
    auto images = groupImages(tags);

    CHECK((toStrings(summarize(images, "amd64")) == std::vector<std::string>{
        "2020-01-01 00:00:00 UTC\t1.0"
    }));
    CHECK((toStrings(summarize(images, "arm64")) == std::vector<std::string>{
        "2020-01-01 00:00:00 UTC\t1.0",
        "2019-01-01 00:00:00 UTC\t0.9"
    }));
    CHECK(summarize(images, "s390x").empty());
    CHECK(summarize(images, "").empty());
}

TEST(TagSummaryTestGroup, platformGroupsAreVisitedInOrder) {
    auto noOS = PlatformKey{std::string{"amd64"}, boost::none, boost::none, boost::none, boost::none, boost::none};
    auto tags = TagRecords{
        makeTag("windows", "sha256:w", {makePlatform("amd64", "windows")}, makeTimestamp("2021-01-01T00:00:00Z")),
        makeTag("linux", "sha256:l", {makePlatform("amd64", "linux")}, makeTimestamp("2021-01-02T00:00:00Z")),
        makeTag("unknown", "sha256:u", {noOS}, makeTimestamp("2021-01-03T00:00:00Z"))
    };
    auto lines = summarize(groupImages(tags), "amd64");

    CHECK((toStrings(lines) == std::vector<std::string>{
        "2021-01-03 00:00:00 UTC\tunknown",
        "2021-01-02 00:00:00 UTC\tlinux",
        "2021-01-01 00:00:00 UTC\twindows"
    }));
}

TEST(TagSummaryTestGroup, joinTagNames) {
    auto image = MergedImage::fromTagNames(makePlatform("amd64"), "sha256:a", {"latest", "1.2"});
    CHECK_EQUAL(joinTagNames(image), std::string{"1.2, latest"});
    CHECK_EQUAL(joinTagNames(image, " "), std::string{"1.2 latest"});
    CHECK_EQUAL(joinTagNames(MergedImage::fromTagNames(makePlatform("amd64"), "sha256:b", {})), std::string{});
}

TEST(TagSummaryTestGroup, printLine) {
    auto line = SummaryLine{makeTimestamp("2020-01-01T00:00:00Z"), "1.0, latest"};
    std::stringstream os;
    os << line;
    CHECK_EQUAL(os.str(), std::string{"2020-01-01 00:00:00 UTC\t1.0, latest"});

    line = SummaryLine{common::EPOCH, "old"};
    CHECK_EQUAL(line.string(), std::string{"1970-01-01 00:00:00 UTC\told"});
}

}
}
}

HUBTAGS_UNITTEST_MAIN_FUNCTION();
