/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_MergedImage_hpp
#define hubtags_tags_MergedImage_hpp

#include <string>
#include <vector>
#include <ostream>

#include "common/Timestamp.hpp"
#include "tags/PlatformKey.hpp"
#include "tags/VersionKey.hpp"
#include "tags/TagRecord.hpp"


namespace hubtags {
namespace tags {

/**
 * All the image records that share one platform and one digest, i.e. the same
 * image binary published under several tags.
 *
 * The tags are kept in rank order (see rankTags): the first one is the dominant tag.
 */
class MergedImage {
public:
    explicit MergedImage(const ImageRecord& record);

    /**
     * Builds an image from tag names alone, without image records. The names are
     * ranked like folded tags; an empty list gives an image without dominant tag.
     */
    static MergedImage fromTagNames(PlatformKey platform,
                                    std::string digest,
                                    const std::vector<std::string>& tagNames,
                                    common::Timestamp lastUpdated = common::EPOCH);

    void fold(const ImageRecord& record);

    const PlatformKey& getPlatform() const { return platform; }
    const std::string& getDigest() const { return digest; }
    const std::vector<VersionKey>& getTags() const { return tags; }
    const VersionKey* getDominantTag() const;
    const common::Timestamp& getLastUpdated() const { return lastUpdated; }
    const std::vector<ImageRecord>& getImageRecords() const { return imageRecords; }

    static std::vector<VersionKey> rankTags(const std::vector<VersionKey>& tags);

private:
    MergedImage(PlatformKey platform, std::string digest, common::Timestamp lastUpdated);

    void addTag(const std::string& name);
    void advanceLastUpdated(const ImageRecord& record);

private:
    PlatformKey platform;
    std::string digest;
    std::vector<VersionKey> tags;
    common::Timestamp lastUpdated = common::EPOCH;
    std::vector<ImageRecord> imageRecords;
};

std::ostream& operator<<(std::ostream&, const MergedImage&);

}
}

#endif
