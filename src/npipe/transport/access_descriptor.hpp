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

#include "npipe/transport/transport_fwd.hpp"
#include "npipe/util/process_credentials_fwd.hpp"

namespace npipe::transport
{

// Types.

/**
 * Who may connect to a server pipe: a util::Permissions_level relative to an owner user and group.
 * Checked by Local_server_pipe against each connecting peer's credentials (`SO_PEERCRED`); a peer that is not
 * permitted is disconnected right away, and the pipe continues waiting.
 *
 * A descriptor whose #m_permissions_lvl is the sentinel (or otherwise out of range) is invalid; creating a server
 * pipe with it fails with error::Code::S_INVALID_ACCESS_DESCRIPTOR.
 */
struct Access_descriptor
{
  // Data.

  /// The access level.
  util::Permissions_level m_permissions_lvl;

  /// Owning user, for util::Permissions_level::S_USER_ACCESS and up.
  util::user_id_t m_owner_user_id;

  /// Owning group, for util::Permissions_level::S_GROUP_ACCESS and up.
  util::group_id_t m_owner_group_id;

  // `static` ctors.

  /**
   * Anyone may connect.  This is the default access.
   * @return See above.
   */
  static Access_descriptor unrestricted();

  /**
   * Only processes running as this process's effective user may connect.
   * @return See above.
   */
  static Access_descriptor current_user_only();

  // Methods.

  /**
   * Whether #m_permissions_lvl is a real level (not the sentinel).
   * @return See above.
   */
  bool valid() const;

  /**
   * Whether a peer with the given credentials may connect.  Always `false` if not valid().
   *
   * @param peer
   *        The connecting peer's credentials.
   * @return See above.
   */
  bool permits(const util::Process_credentials& peer) const;
}; // struct Access_descriptor

} // namespace npipe::transport
