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

#include "npipe/transport/server_pipe.hpp"
#include "npipe/transport/access_descriptor.hpp"
#include "npipe/util/shared_name.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/weak_ptr.hpp>
#include <atomic>

namespace npipe::transport
{

namespace detail
{
class Listen_endpoint;
}

// Types.

/**
 * The Linux Server_pipe: an instance of the named pipe served via a Unix-domain stream socket in the abstract
 * namespace at the pipe's name.  Each instance co-owns the listening socket (detail::Listen_endpoint); while
 * Connected it additionally holds the accepted peer socket.
 *
 * Instances are made by Local_server_pipe_factory, which binds the name on first creation (failing with
 * `boost::asio::error::address_in_use` if another process holds it; so only one server owns a name at a time)
 * and re-uses the binding for further instances while any exist.
 *
 * Each accepted peer socket is made non-blocking, and its kernel send/receive buffers are requested at the minimum
 * (the kernel clamps a request of 0): buffering is the business of Pipe_connection, which writes everything through
 * to the socket immediately.  The peer's credentials are checked against the Access_descriptor; a peer not permitted
 * is disconnected (and logged), and the wait continues.
 */
class Local_server_pipe :
  public Server_pipe,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs a Reserved instance.  Normally invoked by Local_server_pipe_factory.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        See nickname().
   * @param endpoint
   *        The bound listening socket.  Must not be null.
   * @param access
   *        Who may connect.  Must be `valid()`.
   */
  explicit Local_server_pipe(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                             boost::shared_ptr<detail::Listen_endpoint> endpoint, const Access_descriptor& access);

  /// Closes the peer socket, if any; releases its share of the listening socket.
  ~Local_server_pipe() override;

  // Methods.

  /**
   * Implements Server_pipe API.
   *
   * @param cancel
   *        See Server_pipe.
   * @param err_code
   *        See Server_pipe.
   */
  void wait_for_connection(const util::Cancel_signal& cancel, Error_code* err_code = 0) override;

  /**
   * Implements Server_pipe API.
   * @return See Server_pipe.
   */
  bool connected() const override;

  /**
   * Implements Server_pipe API.
   * @return See Server_pipe.
   */
  util::Native_handle release_peer_handle() override;

  /**
   * Implements Server_pipe API.
   * @return See Server_pipe.
   */
  util::Process_credentials peer_process_credentials() const override;

  /// Implements Server_pipe API.
  void disconnect() override;

  /**
   * Implements Server_pipe API.
   * @return See Server_pipe.
   */
  const std::string& nickname() const override;

private:
  // Methods.

  /// Closes #m_peer_hndl if not null.
  void close_peer();

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The shared listening socket.
  const boost::shared_ptr<detail::Listen_endpoint> m_endpoint;

  /// See ctor.
  const Access_descriptor m_access;

  /// See connected().
  std::atomic<bool> m_connected;

  /// The connected peer socket, unless not connected or release_peer_handle() was called.
  util::Native_handle m_peer_hndl;

  /// See peer_process_credentials().
  util::Process_credentials m_peer_creds;
}; // class Local_server_pipe

/**
 * Makes Local_server_pipe instances of one name, binding the name on demand: the first creation (or the first after
 * all previous instances are gone) binds and listens; the rest share that binding.  This is the default
 * Server_pipe_factory for Pipe_listener.  Thread-safe.
 */
class Local_server_pipe_factory :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the factory; binds nothing yet.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param absolute_name
   *        The pipe name.
   * @param access
   *        Access descriptor for every instance.
   */
  explicit Local_server_pipe_factory(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                                     const Access_descriptor& access);

  // Methods.

  /**
   * Creates a Reserved instance, binding the name if necessary.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ACCESS_DESCRIPTOR, `boost::asio::error::address_in_use`, other system codes
   *        from setting up the listening socket.
   * @return Non-null on success.
   */
  Server_pipe_ptr create(Error_code* err_code = 0);

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See ctor.
  const util::Shared_name m_absolute_name;

  /// See ctor.
  const Access_descriptor m_access;

  /// Protects the below.
  Mutex m_mutex;

  /// The current binding, if any instance holds it.
  boost::weak_ptr<detail::Listen_endpoint> m_endpoint;

  /// Instances created so far; used in nicknames.
  uint64_t m_n_created;
}; // class Local_server_pipe_factory

} // namespace npipe::transport
