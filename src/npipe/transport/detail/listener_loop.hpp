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
#include "npipe/transport/accept_queue.hpp"
#include "npipe/transport/pipe_connection.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <boost/thread/future.hpp>
#include <boost/shared_ptr.hpp>

namespace npipe::transport::detail
{

// Types.

/**
 * One of Pipe_listener's K accept cycles, running on its own thread.  At any time it owns exactly one Reserved
 * server pipe (`current`) and waits on it for a client.  On connection it wraps the Connected pipe in a started
 * Pipe_connection, then acquires the replacement `current` from the pool, and only then publishes the connection
 * to the accept queue (waiting for space as needed).  So a fresh instance is always listening before the previous
 * client is visible to the application.
 *
 * Transient faults (`connection_aborted`, `connection_reset`, `broken_pipe`) of a wait are logged and recovered
 * from by replacing `current`; optionally a run of too many consecutive ones becomes fatal.  Cancellation (via the
 * listener's Cancel_signal) ends the loop and completes the queue without error.  Any other fault, including
 * failure to acquire a replacement or an exception thrown along the way, ends the loop and completes the queue with
 * that fault.  Either way `current` is destroyed on exit.
 */
class Listener_loop :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// The accept queue type.
  using Queue = Accept_queue<Pipe_connection_ptr>;

  // Constructors/destructor.

  /**
   * Constructs the loop, not started.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        For logging and the thread name.
   * @param pool
   *        The shared pipe pool.
   * @param queue
   *        The shared accept queue.
   * @param cancel
   *        The listener's shutdown signal.  Must outlive `*this`.
   * @param buf_cfg
   *        For each Pipe_connection.
   * @param max_consecutive_transient_faults
   *        0 for unlimited; else the number of consecutive transient faults tolerated.
   */
  explicit Listener_loop(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                         boost::shared_ptr<Server_pipe_pool> pool, boost::shared_ptr<Queue> queue,
                         const util::Cancel_signal& cancel, const Connection_buffer_config& buf_cfg,
                         size_t max_consecutive_transient_faults);

  /// Joins the thread.  The loop must be done, or at least the Cancel_signal triggered.
  ~Listener_loop();

  // Methods.

  /**
   * Starts the thread and the cycle with the given initial Reserved instance.  Call once.
   *
   * @param initial
   *        Non-null.  Becomes null.
   */
  void start(Server_pipe_ptr&& initial);

  /**
   * Blocks until the cycle has exited and completed the queue (if it was the one to do so).  Returns immediately
   * if start() was not called or did not succeed in starting the thread.
   */
  void wait_done();

  /**
   * Nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Whether the error is one a wait recovers from by replacing its server pipe.
   *
   * @param err_code
   *        Result of Server_pipe::wait_for_connection().
   * @return See above.
   */
  static bool transient_fault(const Error_code& err_code);

private:
  // Methods.

  /**
   * The thread body: runs cycle(), then completes the queue (with the fault, if any) and satisfies
   * #m_done_promise.  An exception escaping cycle() is a fault too: its code if it is a `system_error` carrying one,
   * else error::Code::S_LISTENER_UNEXPECTED_EXCEPTION.
   */
  void run();

  /**
   * The accept cycle proper; returns on cancellation or fault.
   *
   * @param fatal_err_code
   *        Set to the fault, if that's why it returned; else untouched.
   */
  void cycle(Error_code* fatal_err_code);

  /**
   * Inserts into the queue, waiting for space as needed.
   *
   * @param conn
   *        Non-null; becomes null regardless of result.
   * @param fatal_err_code
   *        Set to the fatal fault, if that's why it failed.
   * @return `true` on success; `false` on cancellation (with `*fatal_err_code` falsy) or fault.
   */
  bool publish(Pipe_connection_ptr* conn, Error_code* fatal_err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  const boost::shared_ptr<Server_pipe_pool> m_pool;

  /// See ctor.
  const boost::shared_ptr<Queue> m_queue;

  /// See ctor.
  const util::Cancel_signal& m_cancel;

  /// See ctor.
  const Connection_buffer_config m_buf_cfg;

  /// See ctor.
  const size_t m_max_consecutive_transient_faults;

  /// `current` between start() and run().
  Server_pipe_ptr m_initial_pipe;

  /// Connections published so far; used in connection nicknames.
  uint64_t m_n_published;

  /// Satisfied when run() exits.
  boost::promise<void> m_done_promise;

  /// Result of `m_done_promise.get_future()`.
  boost::unique_future<void> m_done_future;

  /// Whether start() was called.
  bool m_started;

  /// The thread.
  flow::async::Single_thread_task_loop m_worker;
}; // class Listener_loop

} // namespace npipe::transport::detail
