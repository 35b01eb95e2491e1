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

#include <ostream>
#include <flow/common.hpp>

namespace npipe::util
{

#ifndef FLOW_OS_LINUX
static_assert(false, "npipe maps named pipes onto Linux abstract-namespace local sockets.  Build in Linux only.");
#endif
// From this point on (in #including .cpp files as well) POSIX is assumed; and in a few spots specifically Linux.

// Types.

/**
 * A monolayer-thin wrapper around a native handle (a file descriptor in POSIX).  A server pipe instance holds
 * one of these for its connected peer; the connection adapter takes it over when it starts.
 *
 * The value is not closed on destruction: this is a value, not an owner.  However a move-construct or
 * move-assign nullifies the source, so that code passing handles around by `std::move()` cannot accidentally
 * end up with two holders of one descriptor.  The copy operations are available and do the obvious thing.
 */
struct Native_handle
{
  // Types.

  /// The native handle type.  Much logic relies on this type being light-weight (fast to copy).
  using handle_t = int;

  // Constants.

  /// The value for #m_native_handle such that null() is `true`; else it is `false`.
  static const handle_t S_NULL_HANDLE;

  // Data.

  /// The native handle (possibly equal to #S_NULL_HANDLE).
  handle_t m_native_handle;

  // Constructors/destructor.

  /**
   * Constructs with given payload; also subsumes no-args construction to mean constructing an object with
   * null() being `true`.
   *
   * @param native_handle
   *        Payload.
   */
  Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Constructs object equal to `src`, while making `src` null().
   *
   * @param src
   *        Source object which will have `null() == true` upon return.
   */
  Native_handle(Native_handle&& src);

  /**
   * Copy constructor.
   * @param src
   *        Source object.
   */
  Native_handle(const Native_handle& src);

  // Methods.

  /**
   * Sets `*this` equal to `src`, while making `src` null().  No-op if `&src == this`.
   *
   * @param src
   *        Source object which will have `null() == true` upon return.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src);

  /**
   * Copy assignment.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Native_handle& operator=(const Native_handle& src);

  /**
   * Returns `true` if and only if #m_native_handle equals #S_NULL_HANDLE.
   * @return See above.
   */
  bool null() const;
}; // struct Native_handle

// Free functions.

/**
 * Returns `true` if and only if the two Native_handle objects are the same underlying handle.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(Native_handle val1, Native_handle val2);

/**
 * Negation of similar `==`.
 *
 * @param val1
 *        See `==`.
 * @param val2
 *        See `==`.
 * @return See above.
 */
bool operator!=(Native_handle val1, Native_handle val2);

/**
 * Prints string representation of the given `Native_handle` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

} // namespace npipe::util
