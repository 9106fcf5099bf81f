/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_SemanticVersion_hpp
#define hubtags_tags_SemanticVersion_hpp

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>

#include <boost/optional.hpp>


namespace hubtags {
namespace tags {

/**
 * A semantic version as found in image tag names.
 *
 * Besides full "MAJOR.MINOR.PATCH[-PRE][+BUILD]" strings, short forms such as
 * "MAJOR", "MAJOR.", "MAJOR.MINOR." or "MAJOR.MINOR-PRE" are accepted; missing
 * components are zero.
 */
class SemanticVersion {
public:
    using Identifiers = std::vector<std::string>;

public:
    SemanticVersion(std::uint64_t major, std::uint64_t minor, std::uint64_t patch,
                    Identifiers preRelease = {}, Identifiers build = {});

    static boost::optional<SemanticVersion> parse(const std::string&);

    std::uint64_t getMajor() const { return major; }
    std::uint64_t getMinor() const { return minor; }
    std::uint64_t getPatch() const { return patch; }
    const Identifiers& getPreRelease() const { return preRelease; }
    const Identifiers& getBuild() const { return build; }

    bool isPreRelease() const { return !preRelease.empty(); }
    bool isZero() const;
    std::string string() const;

    static Identifiers splitIdentifiers(const std::string&);
    static bool isNumericIdentifier(const std::string&);
    static int compareIdentifiers(const Identifiers& lhs, const Identifiers& rhs);

private:
    std::uint64_t major;
    std::uint64_t minor;
    std::uint64_t patch;
    Identifiers preRelease;
    Identifiers build;
};

int compare(const SemanticVersion&, const SemanticVersion&);

bool operator==(const SemanticVersion&, const SemanticVersion&);
bool operator!=(const SemanticVersion&, const SemanticVersion&);
bool operator<(const SemanticVersion&, const SemanticVersion&);
bool operator<=(const SemanticVersion&, const SemanticVersion&);
bool operator>(const SemanticVersion&, const SemanticVersion&);
std::ostream& operator<<(std::ostream&, const SemanticVersion&);

}
}

#endif
