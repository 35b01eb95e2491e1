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

#include "npipe/util/util_fwd.hpp"
#include "npipe/util/shared_name_fwd.hpp"
#include <flow/common.hpp>
#include <boost/array.hpp>

namespace npipe::util
{

// Constants.

/**
 * Maps general Permissions_level specifier to low-level #Permissions value, when the underlying resource
 * is in the file-system and is either accessible (read-write in terms of file system) or inaccessible.
 * Please see shared_resource_permissions() for the public interface.
 */
extern const boost::array<Permissions, size_t(Permissions_level::S_END_SENTINEL)>
  SHARED_RESOURCE_PERMISSIONS_LVL_MAP;

#ifndef FLOW_OS_LINUX
#  error "NPIPE_KERNEL_PERSISTENT_RUN_DIR (/var/run) semantics require Unix; tested in Linux specifically only."
#endif
/**
 * Absolute path to the directory (without trailing separator) in the file system where kernel-persistent
 * runtime, but not temporary, information shall be placed.  The default home of exclusivity-guard lock files.
 */
extern const fs::path NPIPE_KERNEL_PERSISTENT_RUN_DIR;

// Free functions.

/**
 * Helper that invokes the given function that invokes 1+ ops on some boost.interprocess object (here, a file
 * lock), catching any `bipc::interprocess_exception` and converting it to an #Error_code.  The Flow
 * error-reporting convention is followed: if `err_code` is null, the converted code is thrown as
 * `flow::error::Runtime_error`.
 *
 * If the exception carries a native (errno) code, the emitted code is that system code.  Otherwise
 * `misc_bipc_lib_error` is emitted.  Either way details are logged as a WARNING.
 *
 * @tparam Func
 *         Functor with signature `void ()`.
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param err_code
 *        See above.
 * @param misc_bipc_lib_error
 *        See above.
 * @param context
 *        Brief description of the op, used in logging and (if thrown) the exception message.
 * @param func
 *        The op(s).
 */
template<typename Func>
void op_with_possible_bipc_exception(flow::log::Logger* logger_ptr, Error_code* err_code,
                                     const Error_code& misc_bipc_lib_error,
                                     String_view context,
                                     const Func& func);

} // namespace npipe::util
