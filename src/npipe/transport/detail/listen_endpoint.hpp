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
#include "npipe/util/shared_name.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>

namespace npipe::transport::detail
{

// Types.

/**
 * The bound, listening local stream socket at a pipe name.  Shared (via `shared_ptr`) by every Local_server_pipe
 * of that name; the name is bound for exactly as long as at least one such pipe exists.
 *
 * The socket is non-blocking.  Each Local_server_pipe::wait_for_connection() accepts on its own duplicate of
 * native_handle(); the kernel hands each incoming connection to exactly one of the concurrent waiters.
 */
class Listen_endpoint :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// The listen backlog: further clients wait in the kernel, as with pending named-pipe connects.
  static const int S_BACKLOG;

  // Constructors/destructor.

  /**
   * Binds and listens.  On error `*this` is unusable (native_handle() is null).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param absolute_name
   *        The pipe name.
   * @param err_code
   *        Not null.  #Error_code generated: `boost::asio::error::address_in_use` (name is bound by someone
   *        else), other system codes from `socket()`, `bind()`, `listen()`; see also endpoint_at_shared_name().
   */
  explicit Listen_endpoint(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                           Error_code* err_code);

  /// Closes the socket, unbinding the name.
  ~Listen_endpoint();

  // Methods.

  /**
   * The listening socket.
   * @return See above.
   */
  util::Native_handle native_handle() const;

  /**
   * The pipe name.
   * @return See above.
   */
  const util::Shared_name& absolute_name() const;

private:
  // Data.

  /// See absolute_name().
  const util::Shared_name m_absolute_name;

  /// See native_handle().
  util::Native_handle m_listen_hndl;
}; // class Listen_endpoint

} // namespace npipe::transport::detail
