/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_ImageOrdering_hpp
#define hubtags_tags_ImageOrdering_hpp

#include <vector>

#include "tags/MergedImage.hpp"
#include "tags/ImageGrouper.hpp"


namespace hubtags {
namespace tags {

int compareImages(const MergedImage& lhs, const MergedImage* rhs);
bool ranksBefore(const MergedImage& lhs, const MergedImage& rhs);

std::vector<const MergedImage*> sortByRelevance(const ImagesByDigest& images);

}
}

#endif
