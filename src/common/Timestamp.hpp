/*
 * Hubtags
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef hubtags_common_Timestamp_hpp
#define hubtags_common_Timestamp_hpp

#include <chrono>
#include <string>


namespace hubtags {
namespace common {

using Timestamp = std::chrono::system_clock::time_point;

/** The UNIX epoch, used wherever a timestamp is missing */
const Timestamp EPOCH = Timestamp{};

Timestamp parseTimestamp(const std::string& iso8601);
std::string formatTimestamp(const Timestamp&);

}
}

#endif
