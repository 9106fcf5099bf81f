/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "TagSummary.hpp"

#include <algorithm>
#include <sstream>
#include <initializer_list>

#include "tags/compare.hpp"
#include "tags/ImageOrdering.hpp"


namespace hubtags {
namespace tags {

static int compareFields(const PlatformKey::Field& lhs, const PlatformKey::Field& rhs) {
    return compareAbsentLowest(lhs.get_ptr(), rhs.get_ptr(), [](const std::string& lhsValue, const std::string& rhsValue) {
        return compareValues(lhsValue, rhsValue);
    });
}

// visiting order of the platform groups, absent fields first
static bool isVisitedBefore(const PlatformKey* lhs, const PlatformKey* rhs) {
    auto results = {
        compareFields(lhs->getArchitecture(), rhs->getArchitecture()),
        compareFields(lhs->getFeatures(), rhs->getFeatures()),
        compareFields(lhs->getVariant(), rhs->getVariant()),
        compareFields(lhs->getOS(), rhs->getOS()),
        compareFields(lhs->getOSFeatures(), rhs->getOSFeatures()),
        compareFields(lhs->getOSVersion(), rhs->getOSVersion())
    };
    for(auto result : results) {
        if(result != 0) {
            return result < 0;
        }
    }
    return false;
}

std::vector<SummaryLine> summarize(const ImagesByPlatform& images, const std::string& architecture) {
    auto platforms = std::vector<const PlatformKey*>{};
    for(const auto& entry : images) {
        const auto& platformArchitecture = entry.first.getArchitecture();
        if(platformArchitecture && *platformArchitecture == architecture) {
            platforms.push_back(&entry.first);
        }
    }
    std::sort(platforms.begin(), platforms.end(), isVisitedBefore);

    auto lines = std::vector<SummaryLine>{};
    for(const auto* platform : platforms) {
        for(const auto* image : sortByRelevance(images.at(*platform))) {
            lines.push_back(SummaryLine{image->getLastUpdated(), joinTagNames(*image)});
        }
    }
    return lines;
}

std::string joinTagNames(const MergedImage& image, const std::string& separator) {
    auto joined = std::string{};
    auto isFirst = true;
    for(const auto& tag : image.getTags()) {
        if(!isFirst) {
            joined += separator;
        }
        joined += tag.getName();
        isFirst = false;
    }
    return joined;
}

std::string SummaryLine::string() const {
    auto ss = std::stringstream{};
    ss << *this;
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const SummaryLine& line) {
    os << common::formatTimestamp(line.lastUpdated) << "\t" << line.tags;
    return os;
}

}
}
