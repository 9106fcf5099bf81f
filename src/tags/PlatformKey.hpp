/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_PlatformKey_hpp
#define hubtags_tags_PlatformKey_hpp

#include <string>
#include <ostream>

#include <boost/optional.hpp>


namespace hubtags {
namespace tags {

/**
 * The platform an image was built for. Used only as a grouping key:
 * it has field-wise equality and a hash, but no ordering.
 */
class PlatformKey {
public:
    using Field = boost::optional<std::string>;

    PlatformKey() = default;
    PlatformKey(Field architecture,
                Field features,
                Field variant,
                Field os,
                Field osFeatures,
                Field osVersion);

    const Field& getArchitecture() const { return architecture; }
    const Field& getFeatures() const { return features; }
    const Field& getVariant() const { return variant; }
    const Field& getOS() const { return os; }
    const Field& getOSFeatures() const { return osFeatures; }
    const Field& getOSVersion() const { return osVersion; }

    std::string string() const;

private:
    Field architecture;
    Field features;
    Field variant;
    Field os;
    Field osFeatures;
    Field osVersion;
};

bool operator==(const PlatformKey&, const PlatformKey&);
bool operator!=(const PlatformKey&, const PlatformKey&);
std::ostream& operator<<(std::ostream&, const PlatformKey&);

class PlatformKeyHash {
public:
    size_t operator()(const PlatformKey&) const;
};

}
}

#endif
