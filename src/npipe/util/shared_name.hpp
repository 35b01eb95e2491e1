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

#include "npipe/util/shared_name_fwd.hpp"
#include "npipe/common.hpp"

namespace npipe::util
{

/**
 * String-wrapping abstraction representing a name uniquely distinguishing a kernel-persistent entity from all
 * others in the system; here, chiefly, the name of a named pipe.  Every transport::Server_pipe bound to a given
 * Shared_name serves the same pipe; the transport::Exclusivity_guard for that pipe is keyed by the same name.
 *
 * ### Character set ###
 * A name is *sanitized* (sanitized() returns `true`) if it consists only of `[A-Za-z0-9]` and #S_SEPARATOR,
 * contains no two adjacent separators, and is at most #S_MAX_LENGTH characters long.  Such a name is usable
 * verbatim both as a Linux abstract-namespace socket name and as a file name (for the guard's lock file).
 * sanitize() converts a name that is "almost" sanitized (uses `/` as an alternate separator, repeats separators)
 * into a sanitized one; or reports failure, leaving the name unchanged.
 *
 * Nothing forces a Shared_name to be sanitized at all times; the APIs that require it say so.
 */
class Shared_name
{
public:
  // Constants.

  /// A (default-cted) Shared_name.  May be useful for functions returning `const Shared_name&`.
  static const Shared_name S_EMPTY;

  /**
   * Max value of size() such that, if str() used to name a supported shared resource, sys call safely won't
   * barf.  The abstract-namespace socket path (108 bytes incl. leading NUL) is ample; but the lock file name
   * and some headroom for suffixes argue for a conservative value.
   */
  static const size_t S_MAX_LENGTH;

  /// Character we use, by convention, to separate conceptual folders within str().
  static const char S_SEPARATOR;

  // Constructors/destructor.

  /// Constructs empty() name.
  Shared_name();

  /**
   * Copy-constructs from an existing Shared_name.
   * @param src
   *        Source object.
   */
  Shared_name(const Shared_name& src);

  /**
   * Move-constructs from an existing Shared_name, which is made empty() if not already so.
   * @param src_moved
   *        Source object, which is potentially modified.
   */
  Shared_name(Shared_name&& src_moved);

  // `static` ctors.

  /**
   * Copy-constructs from a `char`-sequence container (including `string`, `util::String_view`).
   * No sanitization or validation is done.
   *
   * @tparam Source
   *         Anything `std::string::assign()` accepts as its single argument.
   * @param src
   *        String to copy.
   * @return The new object.
   */
  template<typename Source>
  static Shared_name ct(const Source& src);

  /**
   * Copy-constructs from a NUL-terminated `const char*` string.
   * @param src
   *        String to copy.
   * @return The new object.
   */
  static Shared_name ct(const char* src);

  /**
   * Move-constructs from a `std::string`.
   * @param src_moved
   *        String to move (make-empty).
   * @return The new object.
   */
  static Shared_name ct(std::string&& src_moved);

  // Methods.

  /**
   * Copy-assigns from an existing Shared_name.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Shared_name& operator=(const Shared_name& src);

  /**
   * Move-assigns from an existing Shared_name.
   * @param src_moved
   *        Source object, which is potentially modified.
   * @return `*this`.
   */
  Shared_name& operator=(Shared_name&& src_moved);

  /**
   * Returns (sans copying) ref to immutable entire wrapped name string, suitable to pass into sys calls when naming
   * supported shared resources.
   *
   * @return See above.
   */
  const std::string& str() const;

  /**
   * Returns (sans copying) pointer to NUL-terminated wrapped name string.
   * @return See above.
   */
  const char* native_str() const;

  /**
   * Returns `str().size()`.
   * @return See above.
   */
  size_t size() const;

  /**
   * Returns `str().empty()`.
   * @return See above.
   */
  bool empty() const;

  /// Makes it so `empty() == true`.
  void clear();

  /**
   * Returns `true` if and only if the contained name is sanitized as defined in the class doc header.
   * @return See above.
   */
  bool sanitized() const;

  /**
   * Best-effort conversion of str() into a sanitized() name.  Each run of `/` and/or #S_SEPARATOR
   * characters becomes one #S_SEPARATOR; any other illegal character, or an over-long result, means failure.
   * On failure `*this` is unchanged.
   *
   * @return `true` if and only if `sanitized() == true` upon return.
   */
  bool sanitize();

  /**
   * Appends a folder separator followed by the given other Shared_name.
   *
   * @param src_to_append
   *        Thing to append after appending separator.
   * @return `*this`.
   */
  Shared_name& operator/=(const Shared_name& src_to_append);

  /**
   * Simply appends a folder separator followed by `raw_name_to_append` to the current value of str().
   *
   * @param raw_name_to_append
   *        Thing to append after appending separator.
   * @return `*this`.
   */
  Shared_name& operator/=(const char* raw_name_to_append);

  /**
   * Appends the given other Shared_name.
   *
   * @param src_to_append
   *        Thing to append.
   * @return `*this`.
   */
  Shared_name& operator+=(const Shared_name& src_to_append);

  /**
   * Simply appends `raw_name_to_append` to the current value of str().
   *
   * @param raw_name_to_append
   *        Thing to append.
   * @return `*this`.
   */
  Shared_name& operator+=(const char* raw_name_to_append);

private:
  // Data.

  /// The name or name fragment; see str().
  std::string m_raw_name;
}; // class Shared_name

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Source>
Shared_name Shared_name::ct(const Source& src) // Static.
{
  Shared_name result;
  result.m_raw_name.assign(src);
  return result;
}

} // namespace npipe::util
