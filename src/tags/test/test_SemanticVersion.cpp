/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>
#include <vector>

#include "tags/SemanticVersion.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace hubtags {
namespace tags {
namespace test {

TEST_GROUP(SemanticVersionTestGroup) {
};

static SemanticVersion parse(const std::string& input) {
    auto version = SemanticVersion::parse(input);
    CHECK(version);
    return *version;
}

TEST(SemanticVersionTestGroup, fullVersion) {
    auto version = parse("1.2.3-rc.1+build.5");
    CHECK(version.getMajor() == 1);
    CHECK(version.getMinor() == 2);
    CHECK(version.getPatch() == 3);
    CHECK((version.getPreRelease() == SemanticVersion::Identifiers{"rc", "1"}));
    CHECK((version.getBuild() == SemanticVersion::Identifiers{"build", "5"}));
    CHECK(version.isPreRelease());
    CHECK_EQUAL(version.string(), std::string{"1.2.3-rc.1+build.5"});
}

TEST(SemanticVersionTestGroup, partialVersions) {
    CHECK(parse("1.2") == SemanticVersion(1, 2, 0));
    CHECK(parse("1.") == SemanticVersion(1, 0, 0));
    CHECK(parse("7") == SemanticVersion(7, 0, 0));
    CHECK_EQUAL(parse("1.2").string(), std::string{"1.2.0"});
}

TEST(SemanticVersionTestGroup, shortVersionsWithIdentifiers) {
    CHECK(parse("1.2.") == SemanticVersion(1, 2, 0));
    CHECK(parse("1..") == SemanticVersion(1, 0, 0));
    CHECK(parse("1.2-rc1") == SemanticVersion(1, 2, 0, {"rc1"}));
    CHECK(parse("1-beta") == SemanticVersion(1, 0, 0, {"beta"}));
    CHECK(parse("1.2+build.7") == SemanticVersion(1, 2, 0, {}, {"build", "7"}));
    CHECK(parse("1.-rc") == SemanticVersion(1, 0, 0, {"rc"}));
    CHECK_EQUAL(parse("1.2-rc1").string(), std::string{"1.2.0-rc1"});
    CHECK(parse("1.2-rc1") < parse("1.2"));
}

TEST(SemanticVersionTestGroup, notVersions) {
    CHECK(!SemanticVersion::parse(""));
    CHECK(!SemanticVersion::parse("latest"));
    CHECK(!SemanticVersion::parse("v1"));
    CHECK(!SemanticVersion::parse("v1.2.3"));
    CHECK(!SemanticVersion::parse("1.2.3.4"));
    CHECK(!SemanticVersion::parse("1.2.3-"));
    CHECK(!SemanticVersion::parse("1.2.3.4-rc1"));
    CHECK(!SemanticVersion::parse("1...2"));
    CHECK(!SemanticVersion::parse(".1"));
    CHECK(!SemanticVersion::parse("1.2-rc_1"));
    CHECK(!SemanticVersion::parse("focal"));
    CHECK(!SemanticVersion::parse("99999999999999999999.0.0"));
}

TEST(SemanticVersionTestGroup, precedence) {
    auto ordered = std::vector<std::string>{
        "1.0.0-alpha",
        "1.0.0-alpha.1",
        "1.0.0-alpha.beta",
        "1.0.0-beta",
        "1.0.0-beta.2",
        "1.0.0-beta.11",
        "1.0.0-rc.1",
        "1.0.0",
        "1.0.0+build",
        "1.0.1",
        "1.1.0",
        "2.0.0",
        "10.0.0"
    };
    for(size_t i = 0; i + 1 < ordered.size(); ++i) {
        auto lhs = parse(ordered[i]);
        auto rhs = parse(ordered[i + 1]);
        CHECK(lhs < rhs);
        CHECK(rhs > lhs);
        CHECK(compare(lhs, rhs) < 0);
        CHECK(compare(rhs, lhs) > 0);
    }
}

TEST(SemanticVersionTestGroup, equality) {
    CHECK(parse("1.2") == parse("1.2.0"));
    CHECK(parse("1.2.0") <= parse("1.2"));
    CHECK(parse("1.2.0-rc.1") != parse("1.2.0-rc.2"));
    CHECK_EQUAL(compare(parse("3.4.5"), parse("3.4.5")), 0);
}

TEST(SemanticVersionTestGroup, identifiers) {
    CHECK((SemanticVersion::splitIdentifiers("rc.1.x") == SemanticVersion::Identifiers{"rc", "1", "x"}));
    CHECK(SemanticVersion::isNumericIdentifier("11"));
    CHECK(!SemanticVersion::isNumericIdentifier("1a"));
    CHECK(!SemanticVersion::isNumericIdentifier("-"));

    // numeric identifiers rank lower than alphanumeric ones
    CHECK(SemanticVersion::compareIdentifiers({"1"}, {"-"}) < 0);
    CHECK(SemanticVersion::compareIdentifiers({"2"}, {"11"}) < 0);
    CHECK(SemanticVersion::compareIdentifiers({"rc"}, {"rc", "1"}) < 0);
    CHECK_EQUAL(SemanticVersion::compareIdentifiers({"a", "1"}, {"a", "1"}), 0);
}

TEST(SemanticVersionTestGroup, zero) {
    CHECK(parse("0.0.0").isZero());
    CHECK(parse("0").isZero());
    CHECK(!parse("0.0.1").isZero());
    CHECK(!parse("1.0.0").isZero());
}

}
}
}

HUBTAGS_UNITTEST_MAIN_FUNCTION();
