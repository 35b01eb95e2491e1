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
#include "npipe/transport/access_descriptor.hpp"
#include "npipe/util/process_credentials.hpp"

namespace npipe::transport
{

// Access_descriptor implementations.

Access_descriptor Access_descriptor::unrestricted() // Static.
{
  using util::Process_credentials;
  return { util::Permissions_level::S_UNRESTRICTED,
           Process_credentials::own_user_id(), Process_credentials::own_group_id() };
}

Access_descriptor Access_descriptor::current_user_only() // Static.
{
  using util::Process_credentials;
  return { util::Permissions_level::S_USER_ACCESS,
           Process_credentials::own_user_id(), Process_credentials::own_group_id() };
}

bool Access_descriptor::valid() const
{
  return size_t(m_permissions_lvl) < size_t(util::Permissions_level::S_END_SENTINEL);
}

bool Access_descriptor::permits(const util::Process_credentials& peer) const
{
  using util::Permissions_level;

  switch (m_permissions_lvl)
  {
  case Permissions_level::S_NO_ACCESS:
    return false;
  case Permissions_level::S_USER_ACCESS:
    return peer.user_id() == m_owner_user_id;
  case Permissions_level::S_GROUP_ACCESS:
    return (peer.user_id() == m_owner_user_id) || (peer.group_id() == m_owner_group_id);
  case Permissions_level::S_UNRESTRICTED:
    return true;
  case Permissions_level::S_END_SENTINEL:
    break;
  }
  return false;
}

std::ostream& operator<<(std::ostream& os, const Access_descriptor& val)
{
  return os << "access[" << val.m_permissions_lvl << " owner " << val.m_owner_user_id << ':'
            << val.m_owner_group_id << ']';
}

bool operator==(const Access_descriptor& val1, const Access_descriptor& val2)
{
  return (val1.m_permissions_lvl == val2.m_permissions_lvl)
         && (val1.m_owner_user_id == val2.m_owner_user_id)
         && (val1.m_owner_group_id == val2.m_owner_group_id);
}

bool operator!=(const Access_descriptor& val1, const Access_descriptor& val2)
{
  return !(val1 == val2);
}

} // namespace npipe::transport
