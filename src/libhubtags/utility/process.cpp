/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include <unistd.h>
#include <limits.h>

#include <boost/format.hpp>

#include "libhubtags/Error.hpp"


namespace libhubtags {
namespace process {

std::string getHostname() {
    auto buffer = std::vector<char>(HOST_NAME_MAX + 1, '\0');
    if(gethostname(buffer.data(), buffer.size() - 1) != 0) {
        auto message = boost::format("Failed to retrieve hostname (%s)") % strerror(errno);
        HUBTAGS_THROW_ERROR(message.str());
    }
    return std::string{buffer.data()};
}

boost::filesystem::path getInstallationPrefixDir() {
    auto executable = boost::filesystem::path{"/proc/self/exe"};
    try {
        auto binDir = boost::filesystem::canonical(executable).parent_path();
        return binDir.parent_path();
    }
    catch(const boost::filesystem::filesystem_error& e) {
        auto message = boost::format("Failed to determine installation prefix from %s") % executable;
        HUBTAGS_RETHROW_ERROR(e, message.str());
    }
}

}}
