/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageOrdering.hpp"

#include <algorithm>

#include "tags/compare.hpp"


namespace hubtags {
namespace tags {

/**
 * Three-way comparison of two images by (dominant tag, last update).
 * An image without tags ranks lower than any image with tags and
 * any image ranks greater than an absent one (nullptr).
 */
int compareImages(const MergedImage& lhs, const MergedImage* rhs) {
    return compareAbsentLowest(&lhs, rhs, [](const MergedImage& lhs, const MergedImage& rhs) -> int {
        auto result = compareAbsentLowest(lhs.getDominantTag(), rhs.getDominantTag(),
            [](const VersionKey& lhsTag, const VersionKey& rhsTag) {
                return compare(lhsTag, rhsTag);
            });
        if(result != 0) {
            return result;
        }
        return compareValues(lhs.getLastUpdated(), rhs.getLastUpdated());
    });
}

/**
 * Total order used for display: more relevant images first, equivalent images
 * by digest.
 */
bool ranksBefore(const MergedImage& lhs, const MergedImage& rhs) {
    auto result = compareImages(lhs, &rhs);
    if(result != 0) {
        return result > 0;
    }
    return lhs.getDigest() < rhs.getDigest();
}

/**
 * Returns the images sorted from the most to the least relevant.
 *
 * Tag comparison falls back to names as soon as one of the two tags is not a
 * version, which is not transitive over mixed sets (e.g. "2" < "10" < "1a" < "2"),
 * so std::sort cannot be used. Images are inserted one by one in digest order,
 * each before the first image it ranks before.
 */
std::vector<const MergedImage*> sortByRelevance(const ImagesByDigest& images) {
    auto byDigest = std::vector<const MergedImage*>{};
    byDigest.reserve(images.size());
    for(const auto& entry : images) {
        byDigest.push_back(&entry.second);
    }
    std::sort(byDigest.begin(), byDigest.end(), [](const MergedImage* lhs, const MergedImage* rhs) {
        return lhs->getDigest() < rhs->getDigest();
    });

    auto sorted = std::vector<const MergedImage*>{};
    sorted.reserve(byDigest.size());
    for(const auto* image : byDigest) {
        auto position = std::find_if(sorted.begin(), sorted.end(), [image](const MergedImage* other) {
            return ranksBefore(*image, *other);
        });
        sorted.insert(position, image);
    }
    return sorted;
}

}
}
