/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_common_RepositoryReference_hpp
#define hubtags_common_RepositoryReference_hpp

#include <string>
#include <ostream>


namespace hubtags {
namespace common {

/**
 * A repository of the Docker Hub, e.g. "library/ubuntu" or "nvidia/cuda".
 */
struct RepositoryReference {
    std::string repositoryNamespace;
    std::string image;

    static RepositoryReference parse(const std::string& input);

    std::string getFullName() const;

    static const std::string DEFAULT_REPOSITORY_NAMESPACE;
};

bool operator==(const RepositoryReference&, const RepositoryReference&);

std::ostream& operator<<(std::ostream&, const RepositoryReference&);

}
}

#endif
