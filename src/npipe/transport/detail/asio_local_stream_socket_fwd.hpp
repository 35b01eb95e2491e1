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

#include "npipe/transport/asio_local_stream_socket_fwd.hpp"
#include "npipe/util/shared_name_fwd.hpp"

namespace npipe::transport::asio_local_stream_socket
{

// Free functions.

/**
 * Returns an #Endpoint corresponding to the given name, in the Linux abstract namespace (a leading NUL byte,
 * then the name; no file-system presence).  This is where a named pipe's listening socket is bound and where
 * clients connect.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param absolute_name
 *        The name.  Should be util::Shared_name::sanitized().
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        whatever boost.asio emits on bad endpoint (in practice: name too long).
 * @return The endpoint; default-constructed on error.
 */
Endpoint endpoint_at_shared_name(flow::log::Logger* logger_ptr,
                                 const util::Shared_name& absolute_name, Error_code* err_code = 0);

} // namespace npipe::transport::asio_local_stream_socket
