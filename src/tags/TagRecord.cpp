/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "TagRecord.hpp"

#include <utility>


namespace hubtags {
namespace tags {

TagRecord::TagRecord(std::string name, common::Timestamp lastUpdated, std::string status)
    : name{std::move(name)}
    , lastUpdated{lastUpdated}
    , status{std::move(status)}
{}

const ImageRecord& TagRecord::addImage(ImageRecord image) {
    image.tag = this;
    images.push_back(std::move(image));
    return images.back();
}

}
}
