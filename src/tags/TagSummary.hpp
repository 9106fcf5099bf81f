/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_TagSummary_hpp
#define hubtags_tags_TagSummary_hpp

#include <string>
#include <vector>
#include <ostream>

#include "common/Timestamp.hpp"
#include "tags/ImageGrouper.hpp"


namespace hubtags {
namespace tags {

struct SummaryLine {
    common::Timestamp lastUpdated;
    std::string tags;

    std::string string() const;
};

std::vector<SummaryLine> summarize(const ImagesByPlatform& images, const std::string& architecture);
std::string joinTagNames(const MergedImage& image, const std::string& separator = ", ");

std::ostream& operator<<(std::ostream&, const SummaryLine&);

}
}

#endif
