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
#include "npipe/util/detail/util_fwd.hpp"
#include "npipe/util/native_handle.hpp"
#include <flow/common.hpp>

namespace npipe::util
{

// Initializations.

const std::string EMPTY_STRING;

// Implementations.

Permissions shared_resource_permissions(Permissions_level permissions_lvl)
{
  const auto raw_lvl = size_t(permissions_lvl);
  assert((raw_lvl < size_t(Permissions_level::S_END_SENTINEL))
         && "Seems the sentinel enum value was specified, or there is an internal maintenance bug.");

  return SHARED_RESOURCE_PERMISSIONS_LVL_MAP[raw_lvl];
}

std::ostream& operator<<(std::ostream& os, Permissions_level val)
{
  switch (val)
  {
  case Permissions_level::S_NO_ACCESS:
    return os << "NO_ACCESS";
  case Permissions_level::S_USER_ACCESS:
    return os << "USER_ACCESS";
  case Permissions_level::S_GROUP_ACCESS:
    return os << "GROUP_ACCESS";
  case Permissions_level::S_UNRESTRICTED:
    return os << "UNRESTRICTED";
  case Permissions_level::S_END_SENTINEL:
    break;
  }
  return os << "INVALID[" << size_t(val) << ']';
}

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

uint8_t* blob_data(const Blob_mutable& blob)
{
  return static_cast<uint8_t*>(blob.data());
}

} // namespace npipe::util
