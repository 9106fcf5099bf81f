/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PlatformKey.hpp"

#include <utility>
#include <sstream>

#include <boost/functional/hash.hpp>


namespace hubtags {
namespace tags {

PlatformKey::PlatformKey(Field architecture,
                         Field features,
                         Field variant,
                         Field os,
                         Field osFeatures,
                         Field osVersion)
    : architecture{std::move(architecture)}
    , features{std::move(features)}
    , variant{std::move(variant)}
    , os{std::move(os)}
    , osFeatures{std::move(osFeatures)}
    , osVersion{std::move(osVersion)}
{}

std::string PlatformKey::string() const {
    auto ss = std::stringstream{};
    ss << *this;
    return ss.str();
}

bool operator==(const PlatformKey& lhs, const PlatformKey& rhs) {
    return lhs.getArchitecture() == rhs.getArchitecture()
        && lhs.getFeatures() == rhs.getFeatures()
        && lhs.getVariant() == rhs.getVariant()
        && lhs.getOS() == rhs.getOS()
        && lhs.getOSFeatures() == rhs.getOSFeatures()
        && lhs.getOSVersion() == rhs.getOSVersion();
}

bool operator!=(const PlatformKey& lhs, const PlatformKey& rhs) {
    return !(lhs == rhs);
}

static void printField(std::ostream& os, const char* name, const PlatformKey::Field& field) {
    os << name << "=";
    if(field) {
        os << "\"" << *field << "\"";
    }
    else {
        os << "null";
    }
}

std::ostream& operator<<(std::ostream& os, const PlatformKey& key) {
    os << "{";
    printField(os, "architecture", key.getArchitecture());
    printField(os << ", ", "features", key.getFeatures());
    printField(os << ", ", "variant", key.getVariant());
    printField(os << ", ", "os", key.getOS());
    printField(os << ", ", "os_features", key.getOSFeatures());
    printField(os << ", ", "os_version", key.getOSVersion());
    os << "}";
    return os;
}

static void combineField(size_t& seed, const PlatformKey::Field& field) {
    // an absent field must not hash like an empty string
    boost::hash_combine(seed, static_cast<bool>(field));
    if(field) {
        boost::hash_combine(seed, *field);
    }
}

size_t PlatformKeyHash::operator()(const PlatformKey& key) const {
    size_t seed = 0;
    combineField(seed, key.getArchitecture());
    combineField(seed, key.getFeatures());
    combineField(seed, key.getVariant());
    combineField(seed, key.getOS());
    combineField(seed, key.getOSFeatures());
    combineField(seed, key.getOSVersion());
    return seed;
}

}
}
