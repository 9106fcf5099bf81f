/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_CompatibleReleaseConstraint_hpp
#define hubtags_tags_CompatibleReleaseConstraint_hpp

#include <string>
#include <ostream>

#include <boost/optional.hpp>

#include "tags/SemanticVersion.hpp"


namespace hubtags {
namespace tags {

/**
 * Pessimistic version constraint "~> VERSION": admits any version from VERSION
 * (inclusive) up to the next release that changes the leftmost component
 * given in VERSION besides the last one.
 *
 *   ~> 1         >= 1.0.0, < 2.0.0-0
 *   ~> 1.2       >= 1.2.0, < 2.0.0-0
 *   ~> 1.2.3     >= 1.2.3, < 1.3.0-0
 *   ~> 1.2.3-rc.1 >= 1.2.3-rc.1, < 1.2.3-rc.-
 *
 * A pre-release version never satisfies a constraint made from a release,
 * unless the constraint's version is 0.0.0.
 */
class CompatibleReleaseConstraint {
public:
    static boost::optional<CompatibleReleaseConstraint> make(const std::string& version);

    bool isSatisfiedBy(const SemanticVersion&) const;

    const std::string& getVersionString() const { return versionString; }
    const SemanticVersion& getLowerBound() const { return lowerBound; }
    const SemanticVersion& getUpperBound() const { return upperBound; }

private:
    CompatibleReleaseConstraint(std::string versionString, SemanticVersion lowerBound, SemanticVersion upperBound);

private:
    std::string versionString;
    SemanticVersion lowerBound;
    SemanticVersion upperBound;
};

std::ostream& operator<<(std::ostream&, const CompatibleReleaseConstraint&);

}
}

#endif
