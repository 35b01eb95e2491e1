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
#include "npipe/transport/local_server_pipe.hpp"
#include "npipe/transport/detail/listen_endpoint.hpp"
#include "npipe/transport/asio_local_stream_socket.hpp"
#include "npipe/transport/error.hpp"
#include "npipe/util/cancel_signal.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <unistd.h>
#include <cerrno>

namespace npipe::transport
{

// Local_server_pipe implementations.

Local_server_pipe::Local_server_pipe(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                     boost::shared_ptr<detail::Listen_endpoint> endpoint,
                                     const Access_descriptor& access) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_endpoint(std::move(endpoint)),
  m_access(access),
  m_connected(false)
{
  assert(m_endpoint);
  FLOW_LOG_TRACE("Server pipe [" << *this << "]: Created on listen endpoint [" << m_endpoint->native_handle() << "] "
                 "with [" << m_access << "].");
}

Local_server_pipe::~Local_server_pipe()
{
  FLOW_LOG_TRACE("Server pipe [" << *this << "]: Destroying.");
  close_peer();
}

void Local_server_pipe::wait_for_connection(const util::Cancel_signal& cancel, Error_code* err_code)
{
  using asio_local_stream_socket::Acceptor;
  using asio_local_stream_socket::Peer_socket;
  using asio_local_stream_socket::Protocol;
  using asio_local_stream_socket::Opt_peer_process_credentials;
  using util::Cancel_registration;
  using boost::asio::io_context;
  using boost::asio::post;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { wait_for_connection(cancel, actual_err_code); },
         err_code, "Local_server_pipe::wait_for_connection()"))
  {
    return;
  }
  // else
  auto& sys_err_code = *err_code;
  sys_err_code.clear();

  assert(!m_connected);

  // Loop only in the case of a refused (access-denied) peer.
  while (true)
  {
    FLOW_LOG_TRACE("Server pipe [" << *this << "]: Waiting for client connection.");

    /* Each waiter accepts on its own dup() of the shared listening handle, in its own tiny event loop, so that it
     * can be interrupted without affecting the other waiters on the same name. */
    const auto dup_hndl = ::dup(m_endpoint->native_handle().m_native_handle);
    if (dup_hndl == -1)
    {
      sys_err_code = Error_code(errno, boost::system::system_category());
      FLOW_LOG_WARNING("Server pipe [" << *this << "]: dup() of listening handle failed; details logged below.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return;
    }
    // else

    io_context task_engine;
    Acceptor acceptor(task_engine);
    acceptor.assign(Protocol(), dup_hndl, sys_err_code);
    if (sys_err_code)
    {
      ::close(dup_hndl);
      FLOW_LOG_WARNING("Server pipe [" << *this << "]: Could not adopt listening handle; details logged below.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return;
    }
    // else

    Peer_socket peer(task_engine);
    Error_code accept_err_code;
    acceptor.async_accept(peer, [&](const Error_code& async_err_code) { accept_err_code = async_err_code; });

    {
      // Its dtor must run before `acceptor` and `task_engine` go away; hence this scope.
      Cancel_registration cancel_reg(cancel, [&]()
      {
        post(task_engine, [&]()
        {
          Error_code dummy;
          acceptor.cancel(dummy); // Acceptor may be closed already; then async_accept() completed anyway.
        });
      });
      task_engine.run();
    }

    if (cancel.cancelled())
    {
      FLOW_LOG_TRACE("Server pipe [" << *this << "]: Wait interrupted by cancellation.");
      sys_err_code = boost::asio::error::operation_aborted;
      return; // `peer` closes the connection, if one arrived concurrently with cancellation.
    }
    // else

    if (accept_err_code)
    {
      sys_err_code = accept_err_code;
      FLOW_LOG_WARNING("Server pipe [" << *this << "]: Accept failed; details logged below.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return;
    }
    // else

    Opt_peer_process_credentials peer_creds;
    peer.get_option(peer_creds, sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Server pipe [" << *this << "]: Could not obtain credentials of connected peer; details "
                       "logged below.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return;
    }
    // else

    if (!m_access.permits(peer_creds))
    {
      FLOW_LOG_WARNING("Server pipe [" << *this << "]: Peer [" << peer_creds << "] not permitted by "
                       "[" << m_access << "]; disconnecting it and waiting again.");
      continue; // `peer` closes the connection.
    }
    // else

    /* Best-effort: ask for minimal kernel buffering (the kernel rounds up to its minimum).  Failure here is not
     * a reason to reject a connection. */
    {
      Error_code opt_err_code;
      peer.set_option(boost::asio::socket_base::send_buffer_size(0), opt_err_code);
      if (opt_err_code)
      {
        FLOW_LOG_TRACE("Server pipe [" << *this << "]: Could not minimize send buffer: [" << opt_err_code << "] "
                       "[" << opt_err_code.message() << "]; ignoring.");
      }
      opt_err_code.clear();
      peer.set_option(boost::asio::socket_base::receive_buffer_size(0), opt_err_code);
      if (opt_err_code)
      {
        FLOW_LOG_TRACE("Server pipe [" << *this << "]: Could not minimize receive buffer: [" << opt_err_code << "] "
                       "[" << opt_err_code.message() << "]; ignoring.");
      }
    }

    peer.non_blocking(true, sys_err_code);
    if (!sys_err_code)
    {
      m_peer_hndl = util::Native_handle(peer.release(sys_err_code));
    }
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Server pipe [" << *this << "]: Could not prepare connected peer socket; details "
                       "logged below.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      m_peer_hndl = util::Native_handle();
      return;
    }
    // else

    m_peer_creds = peer_creds;
    m_connected = true;
    FLOW_LOG_INFO("Server pipe [" << *this << "]: Client [" << m_peer_creds << "] connected via "
                  "[" << m_peer_hndl << "].");
    return;
  } // while (true)
} // Local_server_pipe::wait_for_connection()

bool Local_server_pipe::connected() const
{
  return m_connected;
}

util::Native_handle Local_server_pipe::release_peer_handle()
{
  // Move-from nullifies m_peer_hndl; m_connected stays until disconnect().
  return std::move(m_peer_hndl);
}

util::Process_credentials Local_server_pipe::peer_process_credentials() const
{
  return m_connected ? m_peer_creds : util::Process_credentials();
}

void Local_server_pipe::disconnect()
{
  if (!m_connected)
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Server pipe [" << *this << "]: Disconnecting.");
  close_peer();
  m_peer_creds = util::Process_credentials();
  m_connected = false;
}

void Local_server_pipe::close_peer()
{
  if (!m_peer_hndl.null())
  {
    ::close(m_peer_hndl.m_native_handle);
    m_peer_hndl = util::Native_handle();
  }
}

const std::string& Local_server_pipe::nickname() const
{
  return m_nickname;
}

// Local_server_pipe_factory implementations.

Local_server_pipe_factory::Local_server_pipe_factory(flow::log::Logger* logger_ptr,
                                                     const util::Shared_name& absolute_name,
                                                     const Access_descriptor& access) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_absolute_name(absolute_name),
  m_access(access),
  m_n_created(0)
{
  // Nothing else.
}

Server_pipe_ptr Local_server_pipe_factory::create(Error_code* err_code)
{
  using flow::util::ostream_op_string;
  using boost::make_shared;
  using boost::shared_ptr;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Server_pipe_ptr, Local_server_pipe_factory::create, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!m_access.valid())
  {
    FLOW_LOG_WARNING("Server pipe factory [" << m_absolute_name << "]: Access descriptor [" << m_access << "] "
                     "is invalid.");
    *err_code = error::Code::S_INVALID_ACCESS_DESCRIPTOR;
    return Server_pipe_ptr();
  }
  // else

  Lock_guard lock(m_mutex);

  auto endpoint = m_endpoint.lock();
  if (!endpoint)
  {
    err_code->clear();
    endpoint = make_shared<detail::Listen_endpoint>(get_logger(), m_absolute_name, err_code);
    if (*err_code) // It logged.
    {
      return Server_pipe_ptr();
    }
    // else
    m_endpoint = endpoint;
  }

  err_code->clear();
  return Server_pipe_ptr(new Local_server_pipe(get_logger(),
                                               ostream_op_string(m_absolute_name.str(), '#', ++m_n_created),
                                               std::move(endpoint), m_access));
} // Local_server_pipe_factory::create()

} // namespace npipe::transport
