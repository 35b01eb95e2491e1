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
#include "npipe/util/process_credentials.hpp"
#include <flow/util/util.hpp>
#include <stdexcept>

namespace npipe::transport::asio_local_stream_socket
{

// Types.

#ifndef FLOW_OS_LINUX
static_assert(false, "npipe must define Opt_peer_process_credentials w/ Linux SO_PEERCRED semantics.  "
                       "Build in Linux only.");
#endif

/**
 * Gettable (read-only) socket option for use with asio_local_stream_socket::Peer_socket `.get_option()` in order to
 * get the connected opposing peer process's credentials (PID/UID/GID/etc.).  transport::Local_server_pipe uses it to
 * enforce its transport::Access_descriptor on each newly connected client.
 *
 * If one calls `X.get_option(Opt_peer_process_credentials& o)` on #Peer_socket `X`, and `X` is connected to opposing
 * peer socket, then `o` is filled with the values as of the moment the opposing peer connected.
 */
class Opt_peer_process_credentials :
  public util::Process_credentials
{
public:
  // Constructors/destructor.

  /// Default ctor: each value is initialized to zero or equivalent.
  Opt_peer_process_credentials();

  /**
   * Boring copy ctor.
   * @param src
   *        Source object.
   */
  Opt_peer_process_credentials(const Opt_peer_process_credentials& src);

  // Methods.

  /**
   * Boring copy assignment.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Opt_peer_process_credentials& operator=(const Opt_peer_process_credentials& src);

  /**
   * For internal boost.asio use: the `level` argument of `getsockopt()`.
   *
   * @tparam Protocol
   *         See boost.asio docs.
   * @param proto
   *        See boost.asio docs.
   * @return See above.
   */
  template<typename Protocol>
  int level(const Protocol& proto) const;

  /**
   * For internal boost.asio use: the `option_name` argument of `getsockopt()`.
   *
   * @tparam Protocol
   *         See boost.asio docs.
   * @param proto
   *        See boost.asio docs.
   * @return See above.
   */
  template<typename Protocol>
  int name(const Protocol& proto) const;

  /**
   * For internal boost.asio use: the target buffer for `getsockopt()`.
   *
   * @tparam Protocol
   *         See boost.asio docs.
   * @param proto
   *        See boost.asio docs.
   * @return See above.
   */
  template<typename Protocol>
  void* data(const Protocol& proto);

  /**
   * For internal boost.asio use: the size of data().
   *
   * @tparam Protocol
   *         See boost.asio docs.
   * @param proto
   *        See boost.asio docs.
   * @return See above.
   */
  template<typename Protocol>
  size_t size(const Protocol& proto) const;

  /**
   * For internal boost.asio use: throws unless the kernel reported exactly size() bytes.
   *
   * @tparam Protocol
   *         See boost.asio docs.
   * @param proto
   *        See boost.asio docs.
   * @param new_size_but_really_must_equal_current
   *        See boost.asio docs.
   */
  template<typename Protocol>
  void resize(const Protocol& proto, size_t new_size_but_really_must_equal_current) const;
}; // class Opt_peer_process_credentials

// Template implementations.

template<typename Protocol>
int Opt_peer_process_credentials::level(const Protocol&) const
{
  return SOL_SOCKET;
}

template<typename Protocol>
int Opt_peer_process_credentials::name(const Protocol&) const
{
  return SO_PEERCRED;
}

template<typename Protocol>
void* Opt_peer_process_credentials::data(const Protocol&)
{
  return static_cast<void*>(static_cast<util::Process_credentials*>(this));
}

template<typename Protocol>
size_t Opt_peer_process_credentials::size(const Protocol&) const
{
  return sizeof(util::Process_credentials);
}

template<typename Protocol>
void Opt_peer_process_credentials::resize(const Protocol& proto, size_t new_size_but_really_must_equal_current) const
{
  using flow::util::ostream_op_string;
  using std::length_error;

  if (new_size_but_really_must_equal_current != size(proto))
  {
    throw length_error(ostream_op_string
                         ("Opt_peer_process_credentials does not support resizing; requested size [",
                          new_size_but_really_must_equal_current, "] differs from fixed size [",
                          size(proto), "].  boost.asio internal bug or misuse?"));
  }
}

} // namespace npipe::transport::asio_local_stream_socket
