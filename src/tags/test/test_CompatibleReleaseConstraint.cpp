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
#include <sstream>

#include "tags/SemanticVersion.hpp"
#include "tags/CompatibleReleaseConstraint.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace hubtags {
namespace tags {
namespace test {

TEST_GROUP(CompatibleReleaseConstraintTestGroup) {
};

static CompatibleReleaseConstraint makeConstraint(const std::string& version) {
    auto constraint = CompatibleReleaseConstraint::make(version);
    CHECK(constraint);
    return *constraint;
}

static bool isSatisfied(const std::string& constraint, const std::string& version) {
    auto parsed = SemanticVersion::parse(version);
    CHECK(parsed);
    return makeConstraint(constraint).isSatisfiedBy(*parsed);
}

TEST(CompatibleReleaseConstraintTestGroup, bounds) {
    auto constraint = makeConstraint("1");
    CHECK_EQUAL(constraint.getLowerBound().string(), std::string{"1.0.0"});
    CHECK_EQUAL(constraint.getUpperBound().string(), std::string{"2.0.0-0"});

    constraint = makeConstraint("1.2");
    CHECK_EQUAL(constraint.getLowerBound().string(), std::string{"1.2.0"});
    CHECK_EQUAL(constraint.getUpperBound().string(), std::string{"2.0.0-0"});

    constraint = makeConstraint("1.2.3");
    CHECK_EQUAL(constraint.getLowerBound().string(), std::string{"1.2.3"});
    CHECK_EQUAL(constraint.getUpperBound().string(), std::string{"1.3.0-0"});

    constraint = makeConstraint("1.2.3-rc.1");
    CHECK_EQUAL(constraint.getUpperBound().string(), std::string{"1.2.3-rc.-"});

    constraint = makeConstraint("1.2.3-beta");
    CHECK_EQUAL(constraint.getUpperBound().string(), std::string{"1.2.3-beta.-"});

    constraint = makeConstraint("1.2.3+build.7");
    CHECK_EQUAL(constraint.getUpperBound().string(), std::string{"1.2.3+build.-"});
}

TEST(CompatibleReleaseConstraintTestGroup, invalidConstraints) {
    CHECK(!CompatibleReleaseConstraint::make("1."));
    CHECK(!CompatibleReleaseConstraint::make("latest"));
    CHECK(!CompatibleReleaseConstraint::make("v1"));
    CHECK(!CompatibleReleaseConstraint::make("99999999999999999999"));
    // the bumped component would overflow
    CHECK(!CompatibleReleaseConstraint::make("18446744073709551615"));
    CHECK(!CompatibleReleaseConstraint::make("18446744073709551615.3"));
    CHECK(!CompatibleReleaseConstraint::make("1.18446744073709551615.0"));
}

TEST(CompatibleReleaseConstraintTestGroup, versionsWithoutConstraint) {
    // valid versions whose short form cannot carry a constraint
    const char* versions[] = {"1.", "1.2.", "1..", "1.2-rc1", "1-beta", "1.2+build.7"};
    for(const auto* version : versions) {
        CHECK(SemanticVersion::parse(version));
        CHECK(!CompatibleReleaseConstraint::make(version));
    }
}

TEST(CompatibleReleaseConstraintTestGroup, majorAndMinorLevel) {
    CHECK(isSatisfied("1.2", "1.2"));
    CHECK(isSatisfied("1.2", "1.2.0"));
    CHECK(isSatisfied("1.2", "1.9.9"));
    CHECK(!isSatisfied("1.2", "1.1.9"));
    CHECK(!isSatisfied("1.2", "2.0.0"));
    CHECK(isSatisfied("1", "1.0.0"));
    CHECK(isSatisfied("1", "1.7"));
    CHECK(!isSatisfied("1.2", "1.2-rc1"));
    CHECK(isSatisfied("1", "1.2."));
    CHECK(!isSatisfied("1", "2"));
}

TEST(CompatibleReleaseConstraintTestGroup, patchLevel) {
    CHECK(isSatisfied("1.2.0", "1.2"));
    CHECK(isSatisfied("1.2.3", "1.2.3"));
    CHECK(isSatisfied("1.2.3", "1.2.9"));
    CHECK(!isSatisfied("1.2.3", "1.2.2"));
    CHECK(!isSatisfied("1.2.3", "1.3.0"));
    CHECK(!isSatisfied("1.2.1", "1.2"));
}

TEST(CompatibleReleaseConstraintTestGroup, preReleaseVersions) {
    // a release constraint rejects pre-releases
    CHECK(!isSatisfied("1.2", "1.5.0-rc.1"));
    CHECK(!isSatisfied("1.2.3", "1.2.4-alpha"));
    CHECK(!isSatisfied("1.2", "2.0.0-rc.1"));

    // unless its lower bound is zero
    CHECK(isSatisfied("0.0.0", "0.0.1-alpha"));

    CHECK(isSatisfied("1.2.3-rc.1", "1.2.3-rc.1"));
    CHECK(isSatisfied("1.2.3-rc.1", "1.2.3-rc.2"));
    CHECK(isSatisfied("1.2.3-rc.1", "1.2.3-rc.1.5"));
    CHECK(!isSatisfied("1.2.3-rc.1", "1.2.3-rc.0"));
    CHECK(!isSatisfied("1.2.3-rc.1", "1.2.3-rd"));
    CHECK(!isSatisfied("1.2.3-rc.1", "1.2.3"));

    CHECK(isSatisfied("1.2.3-beta", "1.2.3-beta.4"));
    CHECK(!isSatisfied("1.2.3-beta", "1.2.3-gamma"));
}

TEST(CompatibleReleaseConstraintTestGroup, buildMetadata) {
    CHECK(isSatisfied("1.2.3+build.7", "1.2.3+build.7"));
    CHECK(isSatisfied("1.2.3+build.7", "1.2.3+build.9"));
    CHECK(!isSatisfied("1.2.3+build.7", "1.2.3"));
    CHECK(!isSatisfied("1.2.3+build.7", "1.2.4"));
}

TEST(CompatibleReleaseConstraintTestGroup, print) {
    std::stringstream os;
    os << makeConstraint("1.2");
    CHECK_EQUAL(os.str(), std::string{"~> 1.2"});
    CHECK_EQUAL(makeConstraint("1.2").getVersionString(), std::string{"1.2"});
}

}
}
}

HUBTAGS_UNITTEST_MAIN_FUNCTION();
