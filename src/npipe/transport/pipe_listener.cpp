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
#include "npipe/transport/pipe_listener.hpp"
#include "npipe/transport/detail/listener_loop.hpp"
#include "npipe/transport/local_server_pipe.hpp"
#include "npipe/transport/error.hpp"
#include "npipe/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/make_shared.hpp>
#include <boost/thread/thread.hpp>
#include <algorithm>

namespace npipe::transport
{

// Pipe_listener::Options implementations.

Pipe_listener::Options::Options() :
  m_listener_parallelism(1),
  m_max_read_buffer_size(0),
  m_max_write_buffer_size(0),
  m_restrict_to_current_user(false),
  m_pool_capacity(2 * std::max(1u, boost::thread::hardware_concurrency())),
  m_max_consecutive_transient_faults(0),
  m_lock_dir(util::NPIPE_KERNEL_PERSISTENT_RUN_DIR)
{
  // That's it.
}

// Pipe_listener implementations.

Pipe_listener::Pipe_listener(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                             const Options& opts, Error_code* err_code) :
  Pipe_listener(logger_ptr, absolute_name, opts, Server_pipe_factory(), err_code)
{
  // Done.
}

Pipe_listener::Pipe_listener(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                             const Options& opts, Server_pipe_factory&& factory, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_absolute_name(absolute_name),
  m_opts(opts),
  m_access(resolve_access_descriptor(m_opts)),
  m_buf_cfg{ Stream_buffer_config::from_max_buffer_size(m_opts.m_max_read_buffer_size),
             Stream_buffer_config::from_max_buffer_size(m_opts.m_max_write_buffer_size) },
  m_queue(boost::make_shared<Queue>(get_logger(),
                                    flow::util::ostream_op_string("AcceptQ-", m_absolute_name.str()))),
  m_started(false),
  m_stopped(false),
  m_stop_executed(false)
{
  using flow::error::Runtime_error;
  using flow::util::ostream_op_string;
  using boost::movelib::make_unique;
  using boost::make_shared;

  Error_code sys_err_code;

  if (m_opts.m_listener_parallelism == 0)
  {
    FLOW_LOG_WARNING("Pipe listener [" << *this << "]: Listener parallelism must be at least 1.");
    sys_err_code = error::Code::S_INVALID_ARGUMENT;
  }
  else if (m_absolute_name.empty() || (!m_absolute_name.sanitize()))
  {
    FLOW_LOG_WARNING("Pipe listener [" << *this << "]: Pipe name is empty, too long, or contains characters "
                     "other than alphanumerics and separators.");
    sys_err_code = error::Code::S_INVALID_ARGUMENT;
  }
  else
  {
    auto guard = make_unique<Exclusivity_guard>(get_logger(), m_absolute_name, m_opts.m_lock_dir, &sys_err_code);
    if (!sys_err_code) // Else it logged.
    {
      m_guard = std::move(guard);

      if (!factory)
      {
        const auto local_factory
          = make_shared<Local_server_pipe_factory>(get_logger(), m_absolute_name, m_access);
        factory = [local_factory](Error_code* actual_err_code) { return local_factory->create(actual_err_code); };
      }
      m_pool = make_shared<Server_pipe_pool>(get_logger(), ostream_op_string("Pool-", m_absolute_name.str()),
                                             Server_pipe_pool_policy(std::move(factory)), m_opts.m_pool_capacity,
                                             Error_code(error::Code::S_SERVER_PIPE_POOL_DISPOSED));
    }
  }

  if (sys_err_code)
  {
    // Unusable from now on.  accept() shall report why.
    m_stopped = true;
    m_queue->complete(sys_err_code);

    if (err_code)
    {
      *err_code = sys_err_code;
      return;
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_INFO("Pipe listener [" << *this << "]: Created; parallelism [" << m_opts.m_listener_parallelism << "]; "
                "access [" << m_access << "]; per-connection input [" << m_buf_cfg.m_input << "], "
                "output [" << m_buf_cfg.m_output << "]; pool capacity [" << m_opts.m_pool_capacity << "].");
} // Pipe_listener::Pipe_listener()

Pipe_listener::~Pipe_listener()
{
  stop();
}

void Pipe_listener::start(Error_code* err_code)
{
  using flow::util::ostream_op_string;
  using boost::movelib::make_unique;
  using std::vector;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { start(actual_err_code); },
         err_code, "Pipe_listener::start()"))
  {
    return;
  }
  // else
  err_code->clear();

  Lock_guard lock(m_lifecycle_mutex);

  if (m_stopped)
  {
    FLOW_LOG_WARNING("Pipe listener [" << *this << "]: start() after stop() (or failed construction).");
    *err_code = error::Code::S_LISTENER_STOPPED;
    return;
  }
  if (m_started)
  {
    FLOW_LOG_WARNING("Pipe listener [" << *this << "]: start() called twice.");
    *err_code = error::Code::S_LISTENER_ALREADY_STARTED;
    return;
  }
  // else

  const auto n_loops = m_opts.m_listener_parallelism;

  // All initial pipes first: so any creation error is reported with no loop running yet.
  vector<Server_pipe_ptr> initial_pipes;
  initial_pipes.reserve(n_loops);
  for (size_t idx = 0; idx != n_loops; ++idx)
  {
    auto pipe = m_pool->acquire(err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Pipe listener [" << *this << "]: Could not create initial server pipe [" << idx << "]: "
                       "[" << *err_code << "] [" << err_code->message() << "].  Not starting.");
      return; // initial_pipes destroyed.
    }
    // else
    initial_pipes.emplace_back(std::move(pipe));
  }

  /* Set before any loop starts.  If starting one throws (thread creation), the exception reaches the caller, and
   * stop() still winds down the loops already running; the one that threw has no thread to wait for. */
  m_started = true;
  m_loops.reserve(n_loops);
  for (size_t idx = 0; idx != n_loops; ++idx)
  {
    m_loops.emplace_back(make_unique<detail::Listener_loop>
                           (get_logger(),
                            // (Linux) OS thread name will truncate this to 15 chars; the index goes first for that.
                            ostream_op_string("Lsn", idx, '-', m_absolute_name.str()),
                            m_pool, m_queue, m_cancel, m_buf_cfg, m_opts.m_max_consecutive_transient_faults));
    m_loops.back()->start(std::move(initial_pipes[idx]));
  }

  FLOW_LOG_INFO("Pipe listener [" << *this << "]: Started [" << n_loops << "] listener loops.");
} // Pipe_listener::start()

Pipe_connection_ptr Pipe_listener::accept(Error_code* err_code)
{
  const util::Cancel_signal never_cancelled;
  return accept(never_cancelled, err_code);
}

Pipe_connection_ptr Pipe_listener::accept(const util::Cancel_signal& cancel, Error_code* err_code)
{
  {
    Pipe_connection_ptr result;
    if (flow::error::exec_and_throw_on_error
          ([&](Error_code* actual_err_code) -> Pipe_connection_ptr { return accept(cancel, actual_err_code); },
           &result, err_code, "Pipe_listener::accept()"))
    {
      return result;
    }
  }
  // else
  err_code->clear();

  Pipe_connection_ptr conn;
  while (!m_queue->try_read(&conn))
  {
    if (!m_queue->wait_to_read(cancel, err_code))
    {
      if (*err_code == error::Code::S_INTERRUPTED)
      {
        FLOW_LOG_TRACE("Pipe listener [" << *this << "]: accept() interrupted by caller.");
      }
      else if (*err_code)
      {
        FLOW_LOG_TRACE("Pipe listener [" << *this << "]: accept() reporting listener failure "
                       "[" << *err_code << "] [" << err_code->message() << "].");
      }
      else
      {
        FLOW_LOG_TRACE("Pipe listener [" << *this << "]: accept() reporting end-of-stream.");
      }
      return Pipe_connection_ptr();
    }
    // else: Something to read (or someone will beat us to it; then wait again).
  }

  FLOW_LOG_INFO("Pipe listener [" << *this << "]: Accepted connection [" << *conn << "] from "
                "[" << conn->remote_peer_process_credentials() << "].");
  return conn;
} // Pipe_listener::accept()

void Pipe_listener::stop()
{
  Lock_guard lock(m_lifecycle_mutex);

  if (m_stop_executed)
  {
    return;
  }
  // else
  m_stop_executed = true;
  m_stopped = true;

  FLOW_LOG_INFO("Pipe listener [" << *this << "]: Stopping [" << m_loops.size() << "] listener loops.");

  m_cancel.cancel();

  if (m_guard)
  {
    m_guard->release();
  }

  for (const auto& loop : m_loops)
  {
    loop->wait_done();
  }
  m_loops.clear(); // Threads joined.

  // Nothing acquires from the pool anymore; any connection still out there destroys its pipe at close().
  if (m_pool)
  {
    m_pool->dispose();
  }

  m_queue->complete(); // No-op if a loop did it.

  FLOW_LOG_INFO("Pipe listener [" << *this << "]: Stopped.  [" << m_queue->size() << "] connections remain "
                "available to accept().");
} // Pipe_listener::stop()

const util::Shared_name& Pipe_listener::absolute_name() const
{
  return m_absolute_name;
}

const Access_descriptor& Pipe_listener::access_descriptor() const
{
  return m_access;
}

const Pipe_listener::Options& Pipe_listener::options() const
{
  return m_opts;
}

bool Pipe_listener::started() const
{
  Lock_guard lock(m_lifecycle_mutex);
  return m_started;
}

bool Pipe_listener::stopped() const
{
  Lock_guard lock(m_lifecycle_mutex);
  return m_stopped;
}

Access_descriptor Pipe_listener::resolve_access_descriptor(const Options& opts) // Static.
{
  if (opts.m_access_descriptor)
  {
    return *opts.m_access_descriptor;
  }
  // else
  return opts.m_restrict_to_current_user ? Access_descriptor::current_user_only() : Access_descriptor::unrestricted();
}

std::ostream& operator<<(std::ostream& os, const Pipe_listener& val)
{
  return os << "pipe_lsn[" << val.absolute_name() << "]@" << static_cast<const void*>(&val);
}

} // namespace npipe::transport
