/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageGrouper.hpp"

#include <utility>

#include <boost/format.hpp>

#include "libhubtags/Logger.hpp"


namespace hubtags {
namespace tags {

void ImageGrouper::add(const ImageRecord& record) {
    auto platformIt = images.find(record.platform);
    if(platformIt != images.end()) {
        auto imageIt = platformIt->second.find(record.digest);
        if(imageIt != platformIt->second.end()) {
            imageIt->second.fold(record);
            return;
        }
    }

    auto image = MergedImage{record};
    images[record.platform].emplace(record.digest, std::move(image));
}

void ImageGrouper::add(const TagRecord& tag) {
    for(const auto& image : tag.getImages()) {
        add(image);
    }
}

void ImageGrouper::add(const TagRecords& tags) {
    for(const auto& tag : tags) {
        add(*tag);
    }
}

size_t ImageGrouper::getNumberOfImages() const {
    size_t count = 0;
    for(const auto& platform : images) {
        count += platform.second.size();
    }
    return count;
}

ImagesByPlatform groupImages(const TagRecords& tags) {
    auto grouper = ImageGrouper{};
    grouper.add(tags);

    auto message = boost::format("Grouped %d tags into %d images of %d platforms")
        % tags.size() % grouper.getNumberOfImages() % grouper.getImages().size();
    libhubtags::Logger::getInstance().log(message, "ImageGrouper", libhubtags::LogLevel::DEBUG);

    return grouper.getImages();
}

}
}
