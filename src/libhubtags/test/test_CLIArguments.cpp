/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>
#include <string>
#include <vector>

#include "libhubtags/Error.hpp"
#include "libhubtags/CLIArguments.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace libhubtags {
namespace test {

TEST_GROUP(CLIArgumentsTestGroup) {
};

TEST(CLIArgumentsTestGroup, serialize) {
    auto args = libhubtags::CLIArguments{"tags", "-a", "arm64", "ubuntu"};

    std::stringstream os;
    os << args;

    CHECK_EQUAL(os.str(), std::string{"[\"tags\", \"-a\", \"arm64\", \"ubuntu\"]"});

    os.str("");
    os << libhubtags::CLIArguments{};
    CHECK_EQUAL(os.str(), std::string{"[]"});
}

TEST(CLIArgumentsTestGroup, fromArgv) {
    char arg0[] = "hubtags";
    char arg1[] = "tags";
    char arg2[] = "ubuntu";
    char* argv[] = {arg0, arg1, arg2, nullptr};

    auto args = libhubtags::CLIArguments(3, argv);

    CHECK_EQUAL(args.argc(), 3);
    CHECK(!args.empty());
    CHECK(std::vector<std::string>(args.begin(), args.end()) == (std::vector<std::string>{"hubtags", "tags", "ubuntu"}));
}

TEST(CLIArgumentsTestGroup, nameAndTokens) {
    auto args = libhubtags::CLIArguments{"tags", "--architecture", "arm64", "ubuntu"};
    CHECK_EQUAL(args.getName(), std::string{"tags"});
    CHECK(args.getTokensAfterName() == (std::vector<std::string>{"--architecture", "arm64", "ubuntu"}));

    auto nameOnly = libhubtags::CLIArguments{"version"};
    CHECK_EQUAL(nameOnly.getName(), std::string{"version"});
    CHECK(nameOnly.getTokensAfterName().empty());

    auto none = libhubtags::CLIArguments{};
    CHECK(none.empty());
    CHECK(none.getTokensAfterName().empty());
    CHECK_THROWS(libhubtags::Error, none.getName());
}

TEST(CLIArgumentsTestGroup, pushBackAndRange) {
    auto positional = std::vector<std::string>{"library/ubuntu", "extra"};
    auto args = libhubtags::CLIArguments(positional.cbegin(), positional.cend());
    args.push_back("more");

    CHECK_EQUAL(args.argc(), 3);
    CHECK(std::vector<std::string>(args.begin(), args.end()) == (std::vector<std::string>{"library/ubuntu", "extra", "more"}));
}

}}

HUBTAGS_UNITTEST_MAIN_FUNCTION();
