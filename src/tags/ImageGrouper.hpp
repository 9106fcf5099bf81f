/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_ImageGrouper_hpp
#define hubtags_tags_ImageGrouper_hpp

#include <string>
#include <unordered_map>

#include "tags/PlatformKey.hpp"
#include "tags/TagRecord.hpp"
#include "tags/MergedImage.hpp"


namespace hubtags {
namespace tags {

using ImagesByDigest = std::unordered_map<std::string, MergedImage>;
using ImagesByPlatform = std::unordered_map<PlatformKey, ImagesByDigest, PlatformKeyHash>;

/**
 * Partitions image records by platform, then by digest, merging the records
 * that end up in the same (platform, digest) slot.
 */
class ImageGrouper {
public:
    void add(const ImageRecord& record);
    void add(const TagRecord& tag);
    void add(const TagRecords& tags);

    const ImagesByPlatform& getImages() const { return images; }
    size_t getNumberOfImages() const;

private:
    ImagesByPlatform images;
};

ImagesByPlatform groupImages(const TagRecords& tags);

}
}

#endif
