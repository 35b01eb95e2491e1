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
#include "npipe/transport/detail/listener_loop.hpp"
#include "npipe/transport/error.hpp"
#include <flow/async/util.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/system/system_error.hpp>
#include <exception>

namespace npipe::transport::detail
{

// Listener_loop implementations.

Listener_loop::Listener_loop(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                             boost::shared_ptr<Server_pipe_pool> pool, boost::shared_ptr<Queue> queue,
                             const util::Cancel_signal& cancel, const Connection_buffer_config& buf_cfg,
                             size_t max_consecutive_transient_faults) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_pool(std::move(pool)),
  m_queue(std::move(queue)),
  m_cancel(cancel),
  m_buf_cfg(buf_cfg),
  m_max_consecutive_transient_faults(max_consecutive_transient_faults),
  m_n_published(0),
  m_done_future(m_done_promise.get_future()),
  m_started(false),
  m_worker(get_logger(), m_nickname)
{
  assert(m_pool && m_queue);
}

Listener_loop::~Listener_loop()
{
  // run() returns once m_cancel is triggered, if it hasn't already; so this join does not block forever.
  m_worker.stop();
  FLOW_LOG_TRACE("Listener loop [" << m_nickname << "]: Thread joined.");
}

void Listener_loop::start(Server_pipe_ptr&& initial)
{
  using flow::async::reset_this_thread_pinning;

  assert(initial && (!m_started));
  m_initial_pipe = std::move(initial);

  m_worker.start(reset_this_thread_pinning); // Don't inherit any strange core-affinity.  May throw.
  m_started = true;
  // run() blocks the thread for the loop's life.  It's a dedicated thread, so that's fine.
  m_worker.post([this]() { run(); });
}

void Listener_loop::wait_done()
{
  if (m_started)
  {
    m_done_future.wait();
  }
}

const std::string& Listener_loop::nickname() const
{
  return m_nickname;
}

bool Listener_loop::transient_fault(const Error_code& err_code) // Static.
{
  return (err_code == boost::asio::error::connection_aborted)
         || (err_code == boost::asio::error::connection_reset)
         || (err_code == boost::asio::error::broken_pipe);
}

void Listener_loop::run()
{
  using boost::system::system_error;
  using std::exception;

  Error_code fatal_err_code;
  try
  {
    cycle(&fatal_err_code);
  }
  catch (const system_error& exc)
  {
    FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: Exception thrown while accepting: "
                     "[" << exc.code() << "] [" << exc.what() << "].  Loop will terminate.");
    fatal_err_code = exc.code();
    if (!fatal_err_code)
    {
      fatal_err_code = error::Code::S_LISTENER_UNEXPECTED_EXCEPTION;
    }
  }
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: Exception thrown while accepting: "
                     "[" << exc.what() << "].  Loop will terminate.");
    fatal_err_code = error::Code::S_LISTENER_UNEXPECTED_EXCEPTION;
  }

  if (fatal_err_code)
  {
    m_queue->complete(fatal_err_code);
  }
  else
  {
    FLOW_LOG_INFO("Listener loop [" << m_nickname << "]: Aborted due to shutdown; published "
                  "[" << m_n_published << "] connections.");
    m_queue->complete();
  }

  m_done_promise.set_value();
} // Listener_loop::run()

void Listener_loop::cycle(Error_code* fatal_err_code)
{
  using boost::movelib::make_unique;
  using flow::util::ostream_op_string;

  auto current = std::move(m_initial_pipe);
  size_t n_consecutive_faults = 0;

  FLOW_LOG_INFO("Listener loop [" << m_nickname << "]: Started; initial server pipe [" << *current << "].");

  while (true)
  {
    Error_code err_code;
    current->wait_for_connection(m_cancel, &err_code);

    if (!err_code)
    {
      n_consecutive_faults = 0;

      // Publishing.  First: the Connection, started.  It takes over `current`.
      const auto conn_nickname = ostream_op_string(m_nickname, '.', ++m_n_published);
      const auto pool = m_pool;
      Pipe_connection_ptr conn
        = make_unique<Pipe_connection>(get_logger(), conn_nickname, std::move(current), m_buf_cfg,
                                       [pool](Server_pipe_ptr&& pipe) { pool->release(std::move(pipe)); });
      conn->start(&err_code);
      if (err_code)
      {
        // It logged.  Only this connection is lost; not a listener fault.
        FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: Could not start connection [" << *conn << "]; "
                         "dropping it.");
        conn.reset();
      }

      // Second: the replacement is listening before anyone sees the connection.
      current = m_pool->acquire(&err_code);
      if (err_code)
      {
        FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: Could not acquire replacement server pipe: "
                         "[" << err_code << "] [" << err_code.message() << "].  Loop will terminate.");
        *fatal_err_code = err_code;
        break; // `conn` (if any) closes, returning its pipe.
      }
      // else

      // Third: hand it over.
      if (conn && (!publish(&conn, fatal_err_code)))
      {
        break;
      }
      continue;
    } // if (!err_code)
    // else

    if (m_cancel.cancelled())
    {
      break;
    }
    // else

    if (transient_fault(err_code))
    {
      ++n_consecutive_faults;
      FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: Client connection attempt on [" << *current << "] "
                       "broke (fault [" << n_consecutive_faults << "] in a row): [" << err_code << "] "
                       "[" << err_code.message() << "].  Replacing server pipe and continuing.");
      if ((m_max_consecutive_transient_faults != 0) && (n_consecutive_faults > m_max_consecutive_transient_faults))
      {
        FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: That is more than the limit "
                         "[" << m_max_consecutive_transient_faults << "].  Loop will terminate.");
        *fatal_err_code = error::Code::S_TRANSIENT_FAULT_LIMIT_EXCEEDED;
        break;
      }
      // else

      // Acquire first; then the broken one goes away.
      auto replacement = m_pool->acquire(&err_code);
      if (err_code)
      {
        FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: Could not acquire replacement server pipe: "
                         "[" << err_code << "] [" << err_code.message() << "].  Loop will terminate.");
        *fatal_err_code = err_code;
        break;
      }
      // else
      current = std::move(replacement);
      continue;
    } // if (transient_fault(err_code))
    // else

    FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: Wait for connection on [" << *current << "] failed "
                     "fatally: [" << err_code << "] [" << err_code.message() << "].  Loop will terminate.");
    *fatal_err_code = err_code;
    break;
  } // while (true)
} // Listener_loop::cycle()

bool Listener_loop::publish(Pipe_connection_ptr* conn, Error_code* fatal_err_code)
{
  while (true)
  {
    if (m_queue->try_write(conn))
    {
      FLOW_LOG_TRACE("Listener loop [" << m_nickname << "]: Published connection.");
      return true;
    }
    // else

    Error_code err_code;
    const bool space = m_queue->wait_to_write(m_cancel, &err_code);
    if (err_code)
    {
      assert(err_code == error::Code::S_INTERRUPTED);
      FLOW_LOG_TRACE("Listener loop [" << m_nickname << "]: Shutdown while waiting to publish; dropping "
                     "connection [" << **conn << "].");
      conn->reset();
      return false;
    }
    // else

    if (!space)
    {
      conn->reset();
      if (m_cancel.cancelled())
      {
        return false;
      }
      // else
      FLOW_LOG_WARNING("Listener loop [" << m_nickname << "]: Accept queue closed unexpectedly while waiting "
                       "to publish.  Loop will terminate.");
      *fatal_err_code = error::Code::S_ACCEPT_QUEUE_CLOSED_UNEXPECTEDLY;
      return false;
    }
    // else: Space appeared (someone may yet beat us to it; then we'll wait again).
  }
} // Listener_loop::publish()

} // namespace npipe::transport::detail
