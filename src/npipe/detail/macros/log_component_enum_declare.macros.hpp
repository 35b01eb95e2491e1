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

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* Included (possibly more than once) by npipe/detail/common.hpp and npipe/common.cpp, each time with its own
 * definition of FLOW_LOG_CFG_COMPONENT_DEFINE().  Append new components at the end; never reuse a number. */

// Rarely used component corresponding to log call sites outside namespace `npipe::X`, for all X in ::npipe.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace npipe::transport.
FLOW_LOG_CFG_COMPONENT_DEFINE(TRANSPORT, 1)
// Logging from namespace npipe::util.
FLOW_LOG_CFG_COMPONENT_DEFINE(UTIL, 2)
// Logging from namespace npipe::*::test.
FLOW_LOG_CFG_COMPONENT_DEFINE(TEST, 3)

// -v- Doxygen, please stop ignoring.
/// @endcond
