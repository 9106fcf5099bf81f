/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_TagRecord_hpp
#define hubtags_tags_TagRecord_hpp

#include <string>
#include <vector>
#include <memory>

#include "common/Timestamp.hpp"
#include "tags/PlatformKey.hpp"


namespace hubtags {
namespace tags {

class TagRecord;

/**
 * One platform variant published under a registry tag, as reported by the registry.
 */
struct ImageRecord {
    PlatformKey platform;
    std::string digest;
    std::string status;
    common::Timestamp lastUpdated = common::EPOCH;
    const TagRecord* tag = nullptr; // owner, set by TagRecord::addImage
};

/**
 * One registry tag, as reported by the registry.
 *
 * The images point back to their tag, hence a TagRecord is neither copyable nor
 * movable and is usually held through a std::shared_ptr (see TagRecords).
 */
class TagRecord {
public:
    TagRecord(std::string name, common::Timestamp lastUpdated = common::EPOCH, std::string status = {});
    TagRecord(const TagRecord&) = delete;
    TagRecord& operator=(const TagRecord&) = delete;

    const std::string& getName() const { return name; }
    const common::Timestamp& getLastUpdated() const { return lastUpdated; }
    const std::string& getStatus() const { return status; }
    const std::vector<ImageRecord>& getImages() const { return images; }

    const ImageRecord& addImage(ImageRecord image);

private:
    std::string name;
    common::Timestamp lastUpdated;
    std::string status;
    std::vector<ImageRecord> images;
};

using TagRecords = std::vector<std::shared_ptr<TagRecord>>;

}
}

#endif
