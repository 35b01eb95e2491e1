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

namespace npipe::util
{

// Initializers.

const boost::array<Permissions, size_t(Permissions_level::S_END_SENTINEL)>
  SHARED_RESOURCE_PERMISSIONS_LVL_MAP
    = {
        Permissions(0), // <= NO_ACCESS
        Permissions(0b110000000), // <= USER_ACCESS.  Value a/k/a 0600.
        Permissions(0b110110000), // <= GROUP_ACCESS.  Value a/k/a 660.
        Permissions(0b110110110) // <= UNRESTRICTED.  Value a/k/a 666.
      };

const fs::path NPIPE_KERNEL_PERSISTENT_RUN_DIR = "/var/run";

} // namespace npipe::util
