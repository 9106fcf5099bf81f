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

#include "tags/ImageGrouper.hpp"
#include "tags/test/records.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace hubtags {
namespace tags {
namespace test {

TEST_GROUP(ImageGrouperTestGroup) {
};

TEST(ImageGrouperTestGroup, sameDigestIsMerged) {
    auto tags = TagRecords{ makeTag("1.2", "sha256:a"), makeTag("1.2.0", "sha256:a") };
    auto images = groupImages(tags);

    CHECK_EQUAL(images.size(), 1);
    const auto& imagesByDigest = images.at(makePlatform("amd64"));
    CHECK_EQUAL(imagesByDigest.size(), 1);
    CHECK((getTagNames(imagesByDigest.at("sha256:a")) == std::vector<std::string>{"1.2", "1.2.0"}));
}

TEST(ImageGrouperTestGroup, differentDigestsAreNotMerged) {
    auto tags = TagRecords{ makeTag("a", "sha256:a"), makeTag("b", "sha256:b") };
    auto grouper = ImageGrouper{};
    grouper.add(tags);

    CHECK_EQUAL(grouper.getNumberOfImages(), 2);
    const auto& imagesByDigest = grouper.getImages().at(makePlatform("amd64"));
    CHECK((getTagNames(imagesByDigest.at("sha256:a")) == std::vector<std::string>{"a"}));
    CHECK((getTagNames(imagesByDigest.at("sha256:b")) == std::vector<std::string>{"b"}));
}

TEST(ImageGrouperTestGroup, multiPlatformTags) {
    auto tags = TagRecords{
        makeTag("1.0", "sha256:a", {makePlatform("amd64"), makePlatform("arm64")}),
        makeTag("latest", "sha256:a", {makePlatform("amd64"), makePlatform("arm64"), makePlatform("amd64", "windows")})
    };
    auto grouper = ImageGrouper{};
    for(const auto& tag : tags) {
        grouper.add(*tag);
    }
    const auto& images = grouper.getImages();

    CHECK_EQUAL(images.size(), 3);
    CHECK_EQUAL(grouper.getNumberOfImages(), 3);
    CHECK((getTagNames(images.at(makePlatform("amd64")).at("sha256:a")) == std::vector<std::string>{"1.0", "latest"}));
    CHECK((getTagNames(images.at(makePlatform("arm64")).at("sha256:a")) == std::vector<std::string>{"1.0", "latest"}));
    CHECK((getTagNames(images.at(makePlatform("amd64", "windows")).at("sha256:a")) == std::vector<std::string>{"latest"}));
}

TEST(ImageGrouperTestGroup, absentAndEmptyPlatformFieldsAreDifferentGroups) {
    auto absentOS = PlatformKey{std::string{"amd64"}, boost::none, boost::none, boost::none, boost::none, boost::none};
    auto emptyOS = PlatformKey{std::string{"amd64"}, boost::none, boost::none, std::string{}, boost::none, boost::none};
    auto tags = TagRecords{ makeTag("a", "sha256:a", {absentOS}), makeTag("b", "sha256:a", {emptyOS}) };

    auto images = groupImages(tags);
    CHECK_EQUAL(images.size(), 2);
    CHECK((getTagNames(images.at(absentOS).at("sha256:a")) == std::vector<std::string>{"a"}));
    CHECK((getTagNames(images.at(emptyOS).at("sha256:a")) == std::vector<std::string>{"b"}));
}

TEST(ImageGrouperTestGroup, imageRecordsAreKept) {
    auto tags = TagRecords{ makeTag("1", "sha256:a"), makeTag("1.0", "sha256:a"), makeTag("1.0.0", "sha256:a") };
    auto images = groupImages(tags);

    const auto& records = images.at(makePlatform("amd64")).at("sha256:a").getImageRecords();
    CHECK_EQUAL(records.size(), 3);
    CHECK(records[0].tag == tags[0].get());
    CHECK(records[2].tag == tags[2].get());
}

TEST(ImageGrouperTestGroup, noTags) {
    CHECK(groupImages(TagRecords{}).empty());
    CHECK(groupImages(TagRecords{std::make_shared<TagRecord>("empty")}).empty());
}

}
}
}

HUBTAGS_UNITTEST_MAIN_FUNCTION();
