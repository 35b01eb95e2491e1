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

#ifndef _GNU_SOURCE
#  define _GNU_SOURCE // Needed at least to get access to `struct ::ucred` (Linux).
#endif

#include "npipe/util/util_fwd.hpp"
#include "npipe/util/process_credentials_fwd.hpp"
#include <sys/socket.h>

namespace npipe::util
{

// Types.

/**
 * A process's credentials (PID, UID, GID as of this writing).  A server pipe obtains the connecting peer's
 * credentials (see transport::asio_local_stream_socket::Opt_peer_process_credentials) and checks them against
 * its transport::Access_descriptor; the connection adapter exposes them to the user.
 */
class Process_credentials
{
public:
  // Constructors/destructor.

  /// Default ctor: each value is initialized to zero or equivalent.
  Process_credentials();

  /**
   * Ctor that sets the values explicitly.
   *
   * @param process_id_init
   *        See process_id().
   * @param user_id_init
   *        See user_id().
   * @param group_id_init
   *        See group_id().
   */
  explicit Process_credentials(process_id_t process_id_init, user_id_t user_id_init, group_id_t group_id_init);

  /**
   * Boring copy ctor.
   * @param src
   *        Source object.
   */
  Process_credentials(const Process_credentials& src);

  // Methods.

  /**
   * Boring copy assignment.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Process_credentials& operator=(const Process_credentials& src);

  /**
   * The process ID (PID).
   * @return See above.
   */
  process_id_t process_id() const;

  /**
   * The user ID (UID).
   * @return See above.
   */
  user_id_t user_id() const;

  /**
   * The group user ID (GID).
   * @return See above.
   */
  group_id_t group_id() const;

  /**
   * Obtains the calling process's process_id().
   * @return See above.
   */
  static process_id_t own_process_id();

  /**
   * Obtains the calling process's effective user_id().
   * @return See above.
   */
  static user_id_t own_user_id();

  /**
   * Obtains the calling process's effective group_id().
   * @return See above.
   */
  static group_id_t own_group_id();

  /**
   * Constructs and returns Process_credentials containing values pertaining to the calling process at this time.
   * @return See above.
   */
  static Process_credentials own_process_credentials();

private:
  // Data.

  /// The raw data.  By using Linux `ucred` directly, we can reuse this as base for Opt_peer_process_credentials.
  ::ucred m_val;
}; // class Process_credentials

// Free functions: in *_fwd.hpp.

} // namespace npipe::util
