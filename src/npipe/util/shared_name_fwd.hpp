/* npipe
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "npipe/util/util_fwd.hpp"

namespace npipe::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Shared_name;

// Free functions.

/**
 * Returns new object equal to `Shared_name(src1) /= src2`.
 *
 * @param src1
 *        Object to precede the appended separator and `src2`.
 * @param src2
 *        Object to append after separator.
 * @return See above.
 */
Shared_name operator/(const Shared_name& src1, const Shared_name& src2);

/**
 * Returns new object equal to `Shared_name(src1) /= raw_src2`.
 *
 * @param src1
 *        Object to precede the appended separator and `raw_src2`.
 * @param raw_src2
 *        String to append after separator.
 * @return See above.
 */
Shared_name operator/(const Shared_name& src1, const char* raw_src2);

/**
 * Returns new object equal to `Shared_name(src1) += src2`.
 *
 * @param src1
 *        Object to precede the appended `src2`.
 * @param src2
 *        Object to append.
 * @return See above.
 */
Shared_name operator+(const Shared_name& src1, const Shared_name& src2);

/**
 * Returns new object equal to `Shared_name(src1) += raw_src2`.
 *
 * @param src1
 *        Object to precede the appended `raw_src2`.
 * @param raw_src2
 *        String to append.
 * @return See above.
 */
Shared_name operator+(const Shared_name& src1, const char* raw_src2);

/**
 * Prints embellished string representation of the given Shared_name to the given `ostream`.  Namely it prints
 * the character count, a bar, then the name itself.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Shared_name& val);

/**
 * Returns `true` if and only if `val1.str() == val2.str()`.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Shared_name& val1, const Shared_name& val2);

/**
 * Negation of similar `==`.
 *
 * @param val1
 *        See `==`.
 * @param val2
 *        See `==`.
 * @return See above.
 */
bool operator!=(const Shared_name& val1, const Shared_name& val2);

/**
 * Returns `true` if and only if `val1.str() < val2.str()`.  Enables use in ordered containers.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator<(const Shared_name& val1, const Shared_name& val2);

/**
 * Hasher of Shared_name for boost.unordered et al.
 *
 * @param val
 *        Object to hash.
 * @return See above.
 */
size_t hash_value(const Shared_name& val);

} // namespace npipe::util
