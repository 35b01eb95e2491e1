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
#include "npipe/transport/detail/listen_endpoint.hpp"
#include "npipe/transport/detail/asio_local_stream_socket_fwd.hpp"
#include <flow/error/error.hpp>
#include <unistd.h>

namespace npipe::transport::detail
{

// Static initializers.

const int Listen_endpoint::S_BACKLOG = boost::asio::socket_base::max_listen_connections;

// Listen_endpoint implementations.

Listen_endpoint::Listen_endpoint(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                                 Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_absolute_name(absolute_name)
{
  using asio_local_stream_socket::Acceptor;
  using asio_local_stream_socket::Protocol;
  using asio_local_stream_socket::endpoint_at_shared_name;

  assert(err_code);
  auto& sys_err_code = *err_code;

  const auto local_endpoint = endpoint_at_shared_name(get_logger(), m_absolute_name, &sys_err_code);
  if (sys_err_code) // It logged.
  {
    return;
  }
  // else

  /* The acceptor object is only a convenient way to socket()/bind()/listen() with boost.asio error reporting;
   * the handle is ejected right after.  Each waiter later wraps its own dup() of it in its own acceptor. */
  boost::asio::io_context setup_engine;
  Acceptor acceptor(setup_engine);
  acceptor.open(Protocol(), sys_err_code);
  if (!sys_err_code)
  {
    /* Deliberately no reuse_address: binding a name that another live socket holds must fail with address_in_use.
     * (Moot in the abstract namespace anyway: the name disappears with the last socket, leaving no stale files.) */
    acceptor.bind(local_endpoint, sys_err_code);
  }
  if (!sys_err_code)
  {
    acceptor.listen(S_BACKLOG, sys_err_code);
  }
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Listen endpoint [" << m_absolute_name << "]: Unable to open/bind/listen native local stream "
                     "socket; could be due to the name being already served by someone else; details logged below.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return; // `acceptor` closes the socket.
  }
  // else

  m_listen_hndl = util::Native_handle(acceptor.release(sys_err_code));
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Listen endpoint [" << m_absolute_name << "]: Unable to eject listening socket handle; "
                     "details logged below.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    m_listen_hndl = util::Native_handle();
    return;
  }
  // else

  FLOW_LOG_INFO("Listen endpoint [" << m_absolute_name << "]: Bound and listening via "
                "[" << m_listen_hndl << "], backlog [" << S_BACKLOG << "].");
} // Listen_endpoint::Listen_endpoint()

Listen_endpoint::~Listen_endpoint()
{
  if (!m_listen_hndl.null())
  {
    FLOW_LOG_INFO("Listen endpoint [" << m_absolute_name << "]: Last server pipe instance gone; closing "
                  "[" << m_listen_hndl << "], which unbinds the name.");
    ::close(m_listen_hndl.m_native_handle);
  }
}

util::Native_handle Listen_endpoint::native_handle() const
{
  return m_listen_hndl;
}

const util::Shared_name& Listen_endpoint::absolute_name() const
{
  return m_absolute_name;
}

} // namespace npipe::transport::detail
