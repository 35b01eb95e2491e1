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

#include "npipe/util/native_handle.hpp"
#include "npipe/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>
#include <boost/interprocess/permissions.hpp>
#include <sys/types.h>

/**
 * Flow-style utilities used throughout npipe and available to the user: shared names, native handles,
 * process credentials, cancellation signals, pooled objects.
 */
namespace npipe::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Cancel_signal;
class Cancel_registration;

template<typename Obj, typename Policy>
class Object_pool;

#ifdef FLOW_OS_WIN
static_assert(false, "Design of Permissions_level assumes a POSIX-y security model with users and groups.");
#endif

/**
 * Simple specifier of desired access permissions, usually but not necessarily translated into
 * a `Permissions` value (though even then different values or approaches may be used depending on the resource
 * type).  For example, when applied to a server pipe, the level is checked against the credentials of each
 * connecting peer, relative to the owner user/group recorded alongside it.
 */
enum class Permissions_level : size_t
{
  /// Forbids all access, even by the creator's user.  Most likely this would be useful for testing or debugging.
  S_NO_ACCESS,

  /// Allows access by resource-owning user (in POSIX/Unix identified by UID) and no one else.
  S_USER_ACCESS,

  /**
   * Allows access by resource-owning user's containing group(s) (in POSIX/Unix identified by GID) and no one else.
   * This implies, as well, at least as much access as `S_USER_ACCESS`.
   */
  S_GROUP_ACCESS,

  /// Allows access by all.  Implies, as well, at least as much access as `S_GROUP_ACCESS` and thus `S_USER_ACCESS`.
  S_UNRESTRICTED,

  /// Sentinel: not a valid value.  May be used to, e.g., size an `array<>` mapping from Permissions_level.
  S_END_SENTINEL
}; // enum class Permissions_level

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/// Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
using Blob_const = boost::asio::const_buffer;

/// Short-hand for an mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
using Blob_mutable = boost::asio::mutable_buffer;

/// Syntactic-sugary type for POSIX process ID (integer).
using process_id_t = ::pid_t;

/// Syntactic-sugary type for POSIX user ID (integer).
using user_id_t = ::uid_t;

/// Syntactic-sugary type for POSIX group ID (integer).
using group_id_t = ::gid_t;

/// Short-hand for Unix (POSIX) permissions class.
using Permissions = bipc::permissions;

// Constants.

/// A (default-cted) string.  May be useful for functions returning `const std::string&`.
extern const std::string EMPTY_STRING;

// Free functions.

/**
 * Maps general Permissions_level specifier to low-level #Permissions value, when the underlying resource
 * is in the file-system (e.g., a lock file) and is accessible for read/write by the permitted parties.
 *
 * @param permissions_lvl
 *        The value to translate.  Behavior undefined if it is the sentinel.
 * @return The mapped value.
 */
Permissions shared_resource_permissions(Permissions_level permissions_lvl);

/**
 * Prints string representation of the given `Permissions_level` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Permissions_level val);

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in a mutable buffer, as `uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
uint8_t* blob_data(const Blob_mutable& blob);

std::ostream& operator<<(std::ostream& os, const Cancel_signal& val);

} // namespace npipe::util
