/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_test_utility_unittest_main_function_hpp
#define hubtags_test_utility_unittest_main_function_hpp

#include <boost/regex.hpp>

#include "libhubtags/Error.hpp"
#include "libhubtags/Logger.hpp"

// WATCH OUT!
// boost libraries must be included before CppUTest, so in order to be
// on the safe side include this file as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>


#define HUBTAGS_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    try { \
        /* build the process-wide objects before the leak detector starts counting: */ \
        /* the Logger singleton and the memory block cache of boost::regex */ \
        libhubtags::Logger::getInstance(); \
        boost::regex_match(std::string{"warm-up"}, boost::regex{"[a-z]+-up"}); \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libhubtags::Error& e) { \
        libhubtags::Logger::getInstance().logErrorTrace(e, "test"); \
        throw; \
    } \
}

#endif
