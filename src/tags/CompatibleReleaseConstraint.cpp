/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CompatibleReleaseConstraint.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/regex.hpp>


namespace hubtags {
namespace tags {

namespace regex {
    static const boost::regex patchLevel{"^(\\d+)\\.(\\d+)\\.(\\d+)(?:-([0-9a-z\\-\\.]+))?(?:\\+([0-9a-z\\-\\.]+))?$", boost::regex::icase};
    static const boost::regex minorLevel{"^(\\d+)\\.(\\d+)$"};
    static const boost::regex majorLevel{"^(\\d+)$"};
}

static const auto maxComponent = std::numeric_limits<std::uint64_t>::max();

CompatibleReleaseConstraint::CompatibleReleaseConstraint(std::string versionString,
                                                         SemanticVersion lowerBound,
                                                         SemanticVersion upperBound)
    : versionString{std::move(versionString)}
    , lowerBound{std::move(lowerBound)}
    , upperBound{std::move(upperBound)}
{}

/**
 * The upper bound of a constraint on pre-release or build identifiers keeps all
 * identifiers but the last one, which is bumped to "-": a numeric identifier is
 * replaced (numeric identifiers rank below "-"), an alphanumeric one gets "-" appended.
 */
static SemanticVersion::Identifiers makeUpperBoundIdentifiers(SemanticVersion::Identifiers identifiers) {
    if(SemanticVersion::isNumericIdentifier(identifiers.back())) {
        identifiers.back() = "-";
    }
    else {
        identifiers.push_back("-");
    }
    return identifiers;
}

/**
 * Returns boost::none if the constraint cannot be built from the given version string.
 * Note that "1." is a valid version but not a valid constraint.
 */
boost::optional<CompatibleReleaseConstraint> CompatibleReleaseConstraint::make(const std::string& version) {
    boost::smatch matches;
    try {
        if(boost::regex_match(version, matches, regex::patchLevel)) {
            std::uint64_t major = std::stoull(matches[1].str());
            std::uint64_t minor = std::stoull(matches[2].str());
            std::uint64_t patch = std::stoull(matches[3].str());
            auto preRelease = matches[4].matched ? SemanticVersion::splitIdentifiers(matches[4].str())
                                                 : SemanticVersion::Identifiers{};
            auto build = matches[5].matched ? SemanticVersion::splitIdentifiers(matches[5].str())
                                            : SemanticVersion::Identifiers{};

            auto lower = SemanticVersion{major, minor, patch, preRelease, build};
            if(!build.empty()) {
                auto upper = SemanticVersion{major, minor, patch, preRelease, makeUpperBoundIdentifiers(build)};
                return CompatibleReleaseConstraint{version, lower, upper};
            }
            if(!preRelease.empty()) {
                auto upper = SemanticVersion{major, minor, patch, makeUpperBoundIdentifiers(preRelease)};
                return CompatibleReleaseConstraint{version, lower, upper};
            }
            if(minor == maxComponent) {
                return boost::none;
            }
            auto upper = SemanticVersion{major, minor+1, 0, {"0"}};
            return CompatibleReleaseConstraint{version, lower, upper};
        }

        auto isMinorLevel = boost::regex_match(version, matches, regex::minorLevel);
        if(isMinorLevel || boost::regex_match(version, matches, regex::majorLevel)) {
            std::uint64_t major = std::stoull(matches[1].str());
            std::uint64_t minor = isMinorLevel ? std::stoull(matches[2].str()) : 0;
            if(major == maxComponent) {
                return boost::none;
            }
            auto lower = SemanticVersion{major, minor, 0};
            auto upper = SemanticVersion{major+1, 0, 0, {"0"}};
            return CompatibleReleaseConstraint{version, lower, upper};
        }
    }
    catch(const std::out_of_range&) {
        return boost::none;
    }

    return boost::none;
}

bool CompatibleReleaseConstraint::isSatisfiedBy(const SemanticVersion& version) const {
    if(!lowerBound.isZero() && version.isPreRelease() && !lowerBound.isPreRelease()) {
        return false;
    }
    return lowerBound <= version && version < upperBound;
}

std::ostream& operator<<(std::ostream& os, const CompatibleReleaseConstraint& constraint) {
    os << "~> " << constraint.getVersionString();
    return os;
}

}
}
