/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_tags_compare_hpp
#define hubtags_tags_compare_hpp

namespace hubtags {
namespace tags {

/**
 * Three-way comparison of two values ordered by operator<.
 * Returns a negative number, zero or a positive number.
 */
template<class T>
int compareValues(const T& lhs, const T& rhs) {
    if(lhs < rhs) {
        return -1;
    }
    if(rhs < lhs) {
        return 1;
    }
    return 0;
}

/**
 * Three-way comparison of two possibly absent values (nullptr means absent).
 *
 * An absent value ranks lower than a present one and two absent values are
 * equivalent. Two present values are compared with 'comparePresent', which must
 * return a negative number, zero or a positive number.
 */
template<class T, class Compare>
int compareAbsentLowest(const T* lhs, const T* rhs, Compare comparePresent) {
    if(lhs == nullptr && rhs == nullptr) {
        return 0;
    }
    if(rhs == nullptr) {
        return 1;
    }
    if(lhs == nullptr) {
        return -1;
    }
    return comparePresent(*lhs, *rhs);
}

}
}

#endif
