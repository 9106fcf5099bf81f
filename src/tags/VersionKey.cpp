/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "VersionKey.hpp"

#include <utility>

#include "tags/compare.hpp"


namespace hubtags {
namespace tags {

VersionKey::VersionKey(std::string name)
    : name{std::move(name)}
    , version{SemanticVersion::parse(this->name)}
{}

/**
 * Three-way comparison against a possibly absent key (nullptr):
 * any key ranks greater than an absent one.
 */
int VersionKey::compare(const VersionKey* other) const {
    return compareAbsentLowest(this, other, [](const VersionKey& lhs, const VersionKey& rhs) -> int {
        if(!lhs.hasVersion() || !rhs.hasVersion()) {
            return compareValues(lhs.getName(), rhs.getName());
        }
        auto result = tags::compare(*lhs.getVersion(), *rhs.getVersion());
        if(result != 0) {
            return result;
        }
        return compareValues(lhs.getName(), rhs.getName());
    });
}

int compare(const VersionKey& lhs, const VersionKey& rhs) {
    return lhs.compare(&rhs);
}

bool operator==(const VersionKey& lhs, const VersionKey& rhs) {
    return lhs.getName() == rhs.getName();
}

bool operator!=(const VersionKey& lhs, const VersionKey& rhs) {
    return !(lhs == rhs);
}

bool operator<(const VersionKey& lhs, const VersionKey& rhs) {
    return compare(lhs, rhs) < 0;
}

std::ostream& operator<<(std::ostream& os, const VersionKey& key) {
    os << key.getName();
    return os;
}

}
}
