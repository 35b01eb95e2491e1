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
#include "npipe/util/process_credentials.hpp"
#include "npipe/util/native_handle.hpp"
#include "npipe/util/object_pool.hpp"
#include <boost/noncopyable.hpp>

namespace npipe::transport
{

// Types.

/**
 * One server-side instance of a named pipe: the thing a client connects to.  Abstract, so that the listener
 * machinery can be driven by the real thing (Local_server_pipe) or by a test double.
 *
 * ### States ###
 *   - *Reserved* (a/k/a not connected): connected() is `false`.  Typically it sits in the Server_pipe_pool or
 *     is owned by exactly one listener loop, which calls wait_for_connection() on it.
 *   - *Connected*: wait_for_connection() succeeded; connected() is `true`.  The connected peer's native handle is
 *     ejected with release_peer_handle() (by the Pipe_connection that takes the pipe over), but the pipe remains
 *     Connected until disconnect().  A Connected pipe must never be reused for a new connection.
 *   - *Disconnected*: disconnect() was called; this is again the Reserved state and the pipe is eligible
 *     for reuse by the pool.
 *
 * ### Thread safety ###
 * An instance is used from one thread at a time (ownership passes from pool to loop to connection to pool),
 * except that connected() may be called concurrently with nothing else mutating the object.
 */
class Server_pipe :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Destroys the instance; if connected, the peer (if not ejected) is closed.
  virtual ~Server_pipe();

  // Methods.

  /**
   * Blocks until a client connects to this instance, the given signal is triggered, or an error occurs.
   * Behavior undefined if connected().
   *
   * Errors are one of 2 kinds: *transient*, meaning something went wrong with one incoming connection attempt
   * (`boost::asio::error::connection_aborted`, `connection_reset`, `broken_pipe`), after which the caller should
   * discard this instance and use a new one; or *fatal* (anything else).  If `cancel` is triggered, the method
   * returns promptly with `boost::asio::error::operation_aborted`.
   *
   * @param cancel
   *        Cancellation signal.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: see above.
   */
  virtual void wait_for_connection(const util::Cancel_signal& cancel, Error_code* err_code = 0) = 0;

  /**
   * Whether in Connected state; see class doc header.
   * @return See above.
   */
  virtual bool connected() const = 0;

  /**
   * Ejects the connected peer's native handle, transferring ownership of it to the caller.  The state remains
   * Connected.  Returns a null handle if not connected, or if already ejected.
   *
   * @return See above.
   */
  virtual util::Native_handle release_peer_handle() = 0;

  /**
   * Credentials of the connected peer, as of connection.  Zeroes if not connected.
   * @return See above.
   */
  virtual util::Process_credentials peer_process_credentials() const = 0;

  /**
   * Moves from Connected to Disconnected (Reserved) state, closing the peer handle if it was not ejected.
   * No-op if not connected.
   */
  virtual void disconnect() = 0;

  /**
   * Human-readable name of this instance, for logging.
   * @return See above.
   */
  virtual const std::string& nickname() const = 0;
}; // class Server_pipe

/**
 * The reuse predicate and the creation function for Server_pipe_pool (util::Object_pool).  A returned pipe
 * is reused if and only if it is not connected; creation delegates to a Server_pipe_factory.
 */
class Server_pipe_pool_policy
{
public:
  // Constructors/destructor.

  /**
   * Constructs the policy.
   *
   * @param factory
   *        Creates a fresh Reserved instance.
   */
  explicit Server_pipe_pool_policy(Server_pipe_factory&& factory);

  // Methods.

  /**
   * Creates a fresh instance through the factory.
   *
   * @param err_code
   *        Not null.  Whatever the factory emits.
   * @return Non-null on success.
   */
  Server_pipe_ptr create(Error_code* err_code);

  /**
   * The reuse predicate: `!pipe.connected()`.
   *
   * @param pipe
   *        A returned instance.
   * @return See above.
   */
  static bool should_return(const Server_pipe& pipe);

private:
  // Data.

  /// See ctor.
  Server_pipe_factory m_factory;
}; // class Server_pipe_pool_policy

} // namespace npipe::transport
