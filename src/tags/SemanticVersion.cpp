/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "SemanticVersion.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/regex.hpp>
#include <boost/algorithm/string.hpp>

#include "tags/compare.hpp"


namespace hubtags {
namespace tags {

namespace regex {
    // Semverse's version grammar: dots between the numeric components are optional
    // and pre-release or build identifiers may follow any of them, e.g. "1-beta",
    // "1.2-rc1" or "1.2." (all other forms, like "1.2.3.4" or "v1", are not versions)
    static const boost::regex version{
        "^(\\d+)\\.?(\\d+)?\\.?(\\d+)?(?:-([0-9A-Za-z\\-\\.]+))?(?:\\+([0-9A-Za-z\\-\\.]+))?$"};
}

SemanticVersion::SemanticVersion(std::uint64_t major, std::uint64_t minor, std::uint64_t patch,
                                 Identifiers preRelease, Identifiers build)
    : major{major}
    , minor{minor}
    , patch{patch}
    , preRelease{std::move(preRelease)}
    , build{std::move(build)}
{}

static std::uint64_t toNumber(const boost::ssub_match& match) {
    if(!match.matched) {
        return 0;
    }
    return std::stoull(match.str());
}

/**
 * Returns boost::none when the string is not a version, e.g. "latest" or "v1".
 */
boost::optional<SemanticVersion> SemanticVersion::parse(const std::string& input) {
    boost::smatch matches;
    if(!boost::regex_match(input, matches, regex::version)) {
        return boost::none;
    }
    try {
        auto preRelease = matches[4].matched ? splitIdentifiers(matches[4].str()) : Identifiers{};
        auto build = matches[5].matched ? splitIdentifiers(matches[5].str()) : Identifiers{};
        return SemanticVersion{toNumber(matches[1]), toNumber(matches[2]), toNumber(matches[3]),
                               std::move(preRelease), std::move(build)};
    }
    catch(const std::out_of_range&) {
        // a numeric component doesn't fit in 64 bits: not a version we can rank
        return boost::none;
    }
}

bool SemanticVersion::isZero() const {
    return major == 0 && minor == 0 && patch == 0 && preRelease.empty() && build.empty();
}

std::string SemanticVersion::string() const {
    auto os = std::ostringstream{};
    os << major << "." << minor << "." << patch;
    if(!preRelease.empty()) {
        os << "-" << boost::algorithm::join(preRelease, ".");
    }
    if(!build.empty()) {
        os << "+" << boost::algorithm::join(build, ".");
    }
    return os.str();
}

SemanticVersion::Identifiers SemanticVersion::splitIdentifiers(const std::string& s) {
    auto identifiers = Identifiers{};
    boost::split(identifiers, s, boost::is_any_of("."));
    return identifiers;
}

bool SemanticVersion::isNumericIdentifier(const std::string& identifier) {
    return !identifier.empty()
        && std::all_of(identifier.cbegin(), identifier.cend(), [](char c) { return c >= '0' && c <= '9'; });
}

static int compareNumericIdentifiers(const std::string& lhs, const std::string& rhs) {
    // compare without converting, numeric identifiers may be arbitrarily long
    auto lhsDigits = lhs.substr(std::min(lhs.find_first_not_of('0'), lhs.size()));
    auto rhsDigits = rhs.substr(std::min(rhs.find_first_not_of('0'), rhs.size()));
    if(lhsDigits.size() != rhsDigits.size()) {
        return lhsDigits.size() < rhsDigits.size() ? -1 : 1;
    }
    return lhsDigits.compare(rhsDigits) < 0 ? -1 : (lhsDigits == rhsDigits ? 0 : 1);
}

static int compareIdentifier(const std::string& lhs, const std::string& rhs) {
    auto isLhsNumeric = SemanticVersion::isNumericIdentifier(lhs);
    auto isRhsNumeric = SemanticVersion::isNumericIdentifier(rhs);

    if(isLhsNumeric && isRhsNumeric) {
        return compareNumericIdentifiers(lhs, rhs);
    }
    // numeric identifiers have lower precedence than alphanumeric ones
    if(isLhsNumeric) {
        return -1;
    }
    if(isRhsNumeric) {
        return 1;
    }
    return compareValues(lhs, rhs);
}

/**
 * Identifiers are compared pairwise; when all shared identifiers are equal,
 * the longer list has higher precedence.
 */
int SemanticVersion::compareIdentifiers(const Identifiers& lhs, const Identifiers& rhs) {
    auto size = std::min(lhs.size(), rhs.size());
    for(std::size_t i=0; i<size; ++i) {
        auto result = compareIdentifier(lhs[i], rhs[i]);
        if(result != 0) {
            return result;
        }
    }
    return compareValues(lhs.size(), rhs.size());
}

/**
 * Pre-release versions rank below the release, a release with build metadata
 * ranks above the plain release.
 */
static int getPreReleaseAndBuildPresenceScore(const SemanticVersion& version) {
    if(version.isPreRelease()) {
        return 0;
    }
    return version.getBuild().empty() ? 1 : 2;
}

int compare(const SemanticVersion& lhs, const SemanticVersion& rhs) {
    auto result = compareValues(lhs.getMajor(), rhs.getMajor());
    if(result != 0) {
        return result;
    }
    result = compareValues(lhs.getMinor(), rhs.getMinor());
    if(result != 0) {
        return result;
    }
    result = compareValues(lhs.getPatch(), rhs.getPatch());
    if(result != 0) {
        return result;
    }
    result = compareValues(getPreReleaseAndBuildPresenceScore(lhs), getPreReleaseAndBuildPresenceScore(rhs));
    if(result != 0) {
        return result;
    }
    result = SemanticVersion::compareIdentifiers(lhs.getPreRelease(), rhs.getPreRelease());
    if(result != 0) {
        return result;
    }
    if(!lhs.getBuild().empty() && !rhs.getBuild().empty()) {
        return SemanticVersion::compareIdentifiers(lhs.getBuild(), rhs.getBuild());
    }
    return compareValues(lhs.getBuild().empty() ? 0 : 1, rhs.getBuild().empty() ? 0 : 1);
}

bool operator==(const SemanticVersion& lhs, const SemanticVersion& rhs) {
    return compare(lhs, rhs) == 0;
}

bool operator!=(const SemanticVersion& lhs, const SemanticVersion& rhs) {
    return !(lhs == rhs);
}

bool operator<(const SemanticVersion& lhs, const SemanticVersion& rhs) {
    return compare(lhs, rhs) < 0;
}

bool operator<=(const SemanticVersion& lhs, const SemanticVersion& rhs) {
    return compare(lhs, rhs) <= 0;
}

bool operator>(const SemanticVersion& lhs, const SemanticVersion& rhs) {
    return compare(lhs, rhs) > 0;
}

std::ostream& operator<<(std::ostream& os, const SemanticVersion& version) {
    os << version.string();
    return os;
}

}
}
