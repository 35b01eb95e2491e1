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
#include "npipe/common.hpp"

namespace npipe
{

// Initializers.

const boost::unordered_multimap<Log_component, std::string> S_NPIPE_LOG_COMPONENT_NAME_MAP
  {
#define FLOW_LOG_CFG_COMPONENT_DEFINE(ARG_name_root, ARG_enum_val) \
    { Log_component::S_##ARG_name_root, #ARG_name_root },
#include "npipe/detail/macros/log_component_enum_declare.macros.hpp"
#undef FLOW_LOG_CFG_COMPONENT_DEFINE
  };

} // namespace npipe
