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
#include "npipe/util/process_credentials.hpp"
#include <unistd.h>

namespace npipe::util
{

// Process_credentials implementations.

Process_credentials::Process_credentials() :
  Process_credentials(0, 0, 0)
{
  // That's it.
}

Process_credentials::Process_credentials(process_id_t process_id_init, user_id_t user_id_init, group_id_t group_id_init)
{
  // Assign by member name; the ordering of the fields in `ucred` is not something to rely upon.
  m_val.pid = process_id_init;
  m_val.uid = user_id_init;
  m_val.gid = group_id_init;
}

Process_credentials::Process_credentials(const Process_credentials&) = default;
Process_credentials& Process_credentials::operator=(const Process_credentials&) = default;

process_id_t Process_credentials::process_id() const
{
  return m_val.pid;
}

user_id_t Process_credentials::user_id() const
{
  return m_val.uid;
}

group_id_t Process_credentials::group_id() const
{
  return m_val.gid;
}

process_id_t Process_credentials::own_process_id() // Static.
{
  return ::getpid();
}

user_id_t Process_credentials::own_user_id() // Static.
{
  return ::geteuid();
}

group_id_t Process_credentials::own_group_id() // Static.
{
  return ::getegid();
}

Process_credentials Process_credentials::own_process_credentials() // Static.
{
  return Process_credentials(own_process_id(), own_user_id(), own_group_id());
}

bool operator==(const Process_credentials& val1, const Process_credentials& val2)
{
  return (val1.process_id() == val2.process_id())
         && (val1.user_id() == val2.user_id()) && (val1.group_id() == val2.group_id());
}

bool operator!=(const Process_credentials& val1, const Process_credentials& val2)
{
  return !operator==(val1, val2);
}

std::ostream& operator<<(std::ostream& os, const Process_credentials& val)
{
  return os << "pid[" << val.process_id() << "], user[" << val.user_id() << ':' << val.group_id() << ']';
}

} // namespace npipe::util
