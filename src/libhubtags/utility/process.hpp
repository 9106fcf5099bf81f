/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libhubtags_utility_process_hpp
#define libhubtags_utility_process_hpp

#include <string>

#include <boost/filesystem.hpp>


namespace libhubtags {
namespace process {

std::string getHostname();

/**
 * Prefix under which hubtags is installed, i.e. the parent of the directory
 * holding the running executable. The default configuration lives in <prefix>/etc.
 */
boost::filesystem::path getInstallationPrefixDir();

}}

#endif
