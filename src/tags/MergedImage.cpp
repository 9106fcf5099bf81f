/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "MergedImage.hpp"

#include <algorithm>
#include <utility>

#include <boost/format.hpp>

#include "libhubtags/Error.hpp"
#include "tags/CompatibleReleaseConstraint.hpp"


namespace hubtags {
namespace tags {

static const TagRecord& getOwningTag(const ImageRecord& record) {
    if(record.tag == nullptr) {
        auto message = boost::format("Image record with digest %s is not attached to any tag record")
            % record.digest;
        HUBTAGS_THROW_ERROR(message.str());
    }
    return *record.tag;
}

MergedImage::MergedImage(const ImageRecord& record)
    : platform{record.platform}
    , digest{record.digest}
{
    const auto& tag = getOwningTag(record);
    tags.emplace_back(tag.getName());
    advanceLastUpdated(record);
    imageRecords.push_back(record);
}

MergedImage::MergedImage(PlatformKey platform, std::string digest, common::Timestamp lastUpdated)
    : platform{std::move(platform)}
    , digest{std::move(digest)}
    , lastUpdated{lastUpdated}
{}

MergedImage MergedImage::fromTagNames(PlatformKey platform,
                                      std::string digest,
                                      const std::vector<std::string>& tagNames,
                                      common::Timestamp lastUpdated) {
    auto image = MergedImage{std::move(platform), std::move(digest), lastUpdated};
    for(const auto& name : tagNames) {
        image.addTag(name);
    }
    return image;
}

/**
 * Merges a further record of this image: adds the owning tag (unless a tag with
 * the same name is already there), re-ranks the tags and advances the timestamp.
 * Throws if the record belongs to another platform or digest, in which case
 * this image is left untouched.
 */
void MergedImage::fold(const ImageRecord& record) {
    if(record.digest != digest) {
        auto message = boost::format("Cannot merge image record with digest %s into image with digest %s")
            % record.digest % digest;
        HUBTAGS_THROW_ERROR(message.str());
    }
    if(record.platform != platform) {
        auto message = boost::format("Cannot merge image record of platform %s into image %s of platform %s")
            % record.platform % digest % platform;
        HUBTAGS_THROW_ERROR(message.str());
    }
    const auto& tag = getOwningTag(record);

    addTag(tag.getName());
    advanceLastUpdated(record);
    imageRecords.push_back(record);
}

const VersionKey* MergedImage::getDominantTag() const {
    if(tags.empty()) {
        return nullptr;
    }
    return &tags.front();
}

void MergedImage::addTag(const std::string& name) {
    auto isSameTag = [&name](const VersionKey& key) { return key.getName() == name; };
    if(std::any_of(tags.cbegin(), tags.cend(), isSameTag)) {
        return;
    }
    tags.emplace_back(name);
    tags = rankTags(tags);
}

void MergedImage::advanceLastUpdated(const ImageRecord& record) {
    lastUpdated = std::max({lastUpdated, record.tag->getLastUpdated(), record.lastUpdated});
}

/**
 * Orders tags so that the most general version comes first.
 *
 * Every versioned tag T votes with the number of versioned tags (T included) that
 * satisfy "~> T". Voters are sorted by (votes, name length descending, name) and the
 * sequence is reversed: the tag admitting the most siblings and, among those, the
 * shortest name wins. Unversioned tags and tags that cannot be made into a
 * constraint follow, sorted by name.
 */
std::vector<VersionKey> MergedImage::rankTags(const std::vector<VersionKey>& tags) {
    struct Voter {
        const VersionKey* tag;
        size_t votes;
    };

    auto versioned = std::vector<const VersionKey*>{};
    auto trailing = std::vector<const VersionKey*>{};
    for(const auto& tag : tags) {
        if(tag.hasVersion()) {
            versioned.push_back(&tag);
        }
        else {
            trailing.push_back(&tag);
        }
    }

    auto voters = std::vector<Voter>{};
    for(const auto* tag : versioned) {
        auto constraint = CompatibleReleaseConstraint::make(tag->getName());
        if(!constraint) {
            trailing.push_back(tag);
            continue;
        }
        auto votes = std::count_if(versioned.cbegin(), versioned.cend(), [&constraint](const VersionKey* other) {
            return constraint->isSatisfiedBy(*other->getVersion());
        });
        voters.push_back(Voter{tag, static_cast<size_t>(votes)});
    }

    std::sort(voters.begin(), voters.end(), [](const Voter& lhs, const Voter& rhs) {
        if(lhs.votes != rhs.votes) {
            return lhs.votes < rhs.votes;
        }
        const auto& lhsName = lhs.tag->getName();
        const auto& rhsName = rhs.tag->getName();
        if(lhsName.size() != rhsName.size()) {
            return lhsName.size() > rhsName.size();
        }
        return lhsName < rhsName;
    });
    std::reverse(voters.begin(), voters.end());

    std::sort(trailing.begin(), trailing.end(), [](const VersionKey* lhs, const VersionKey* rhs) {
        return lhs->getName() < rhs->getName();
    });

    auto ranked = std::vector<VersionKey>{};
    ranked.reserve(tags.size());
    for(const auto& voter : voters) {
        ranked.push_back(*voter.tag);
    }
    for(const auto* tag : trailing) {
        ranked.push_back(*tag);
    }
    return ranked;
}

std::ostream& operator<<(std::ostream& os, const MergedImage& image) {
    os << image.getDigest() << " [";
    auto separator = "";
    for(const auto& tag : image.getTags()) {
        os << separator << tag;
        separator = ", ";
    }
    os << "] " << common::formatTimestamp(image.getLastUpdated());
    return os;
}

}
}
