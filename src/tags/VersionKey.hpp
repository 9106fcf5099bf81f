/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_VersionKey_hpp
#define hubtags_tags_VersionKey_hpp

#include <string>
#include <ostream>

#include <boost/optional.hpp>

#include "tags/SemanticVersion.hpp"


namespace hubtags {
namespace tags {

/**
 * A tag name together with the semantic version it spells, if any.
 *
 * The name is the identity of the key: two keys are equal iff their names are equal.
 * Keys are ordered by (version, name) when both have a version, by name otherwise.
 */
class VersionKey {
public:
    explicit VersionKey(std::string name);

    const std::string& getName() const { return name; }
    const boost::optional<SemanticVersion>& getVersion() const { return version; }
    bool hasVersion() const { return static_cast<bool>(version); }

    int compare(const VersionKey* other) const;

private:
    std::string name;
    boost::optional<SemanticVersion> version;
};

int compare(const VersionKey&, const VersionKey&);

bool operator==(const VersionKey&, const VersionKey&);
bool operator!=(const VersionKey&, const VersionKey&);
bool operator<(const VersionKey&, const VersionKey&);
std::ostream& operator<<(std::ostream&, const VersionKey&);

}
}

#endif
