/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "RepositoryReference.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libhubtags/Error.hpp"
#include "libhubtags/Logger.hpp"


namespace hubtags {
namespace common {

namespace regex {

// path components start with a lower case letter or digit and may embed one period,
// one or two underscores or any number of dashes as separators
const std::string pathComponent{"[a-z0-9]+(?:(?:[._]|__|[-]+)[a-z0-9]+)*"};

// "<namespace>/<image>" or "<image>", capturing namespace and image
const boost::regex repository{"^(?:(" + pathComponent + ")\\/)?(" + pathComponent + ")$"};

}

const std::string RepositoryReference::DEFAULT_REPOSITORY_NAMESPACE{"library"};

/**
 * Parse a repository name given by the user. Names without a namespace
 * refer to the official images, i.e. "ubuntu" is "library/ubuntu".
 */
RepositoryReference RepositoryReference::parse(const std::string& input) {
    boost::smatch matches;
    if(!boost::regex_match(input, matches, regex::repository)) {
        auto message = boost::format("Invalid repository '%s'\n"
                                     "Expected [NAMESPACE/]NAME with lower case letters, digits"
                                     " and separators") % input;
        libhubtags::Logger::getInstance().log(message, "RepositoryReference", libhubtags::LogLevel::GENERAL, std::cerr);
        HUBTAGS_THROW_ERROR(message.str(), libhubtags::LogLevel::INFO);
    }

    auto reference = RepositoryReference{};
    reference.repositoryNamespace = matches[1].matched ? matches[1].str() : DEFAULT_REPOSITORY_NAMESPACE;
    reference.image = matches[2].str();
    return reference;
}

std::string RepositoryReference::getFullName() const {
    auto format = boost::format{"%s/%s"}
            % repositoryNamespace
            % image;
    return format.str();
}

bool operator==(const RepositoryReference& lhs, const RepositoryReference& rhs) {
    return lhs.repositoryNamespace == rhs.repositoryNamespace
        && lhs.image == rhs.image;
}

std::ostream& operator<<(std::ostream& os, const RepositoryReference& reference) {
    os << reference.getFullName();
    return os;
}

}
}
