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

#include "npipe/transport/access_descriptor.hpp"
#include "npipe/transport/accept_queue.hpp"
#include "npipe/transport/pipe_connection.hpp"
#include "npipe/transport/exclusivity_guard.hpp"
#include "npipe/util/cancel_signal.hpp"
#include "npipe/util/shared_name.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <optional>
#include <vector>

namespace npipe::transport
{

namespace detail
{
class Listener_loop;
}

// Types.

/**
 * Server-side acceptor of connections to a named pipe: listens on a well-known util::Shared_name and hands each
 * connecting client to the application, via accept(), as a Pipe_connection.
 *
 * ### Operation ###
 * The constructor acquires the name's Exclusivity_guard and sets up the server pipe pool (#Server_pipe_pool) and the
 * capacity-1 Accept_queue.  start() acquires K (Options::m_listener_parallelism) Reserved server pipes and runs, for
 * each, a listener loop on its own thread; so up to K clients can be in the middle of connecting at once, and
 * a fresh instance is always waiting.  Each loop hands its accepted connections to the queue; accept() takes them
 * out.  Clients beyond what the queue holds wait in the kernel.
 *
 * ### Shutdown ###
 * stop() (or the destructor) triggers cancellation, releases the guard, waits for every loop to exit, disposes the
 * pool, and then closes the queue.  After that accept() returns connections still in the queue, if any, then
 * end-of-stream: null with no error.  If a loop failed fatally, accept() instead reports that error (once the queue
 * is drained), to every caller from then on.  stop() is idempotent, and OK to call before start().
 *
 * ### Thread safety ###
 * accept() may be called concurrently from any number of threads, concurrently with start() and stop().
 * start() and stop() may be called concurrently with each other too.  Do not call stop() from a
 * Pipe_connection handler.
 */
class Pipe_listener :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Configuration.  The defaults are as documented for each member.
  struct Options
  {
    // Data.

    /// K: number of concurrent listener loops.  Default 1.  Must be at least 1.
    size_t m_listener_parallelism;

    /// Input buffer size per connection: reading from the peer pauses when full.  0 (default) means unbounded.
    size_t m_max_read_buffer_size;

    /// Output buffer size per connection: write completion is deferred when full.  0 (default) means unbounded.
    size_t m_max_write_buffer_size;

    /// If no #m_access_descriptor: whether to allow only this process's user (else anyone).  Default `false`.
    bool m_restrict_to_current_user;

    /// If set, who may connect.  Default: not set.
    std::optional<Access_descriptor> m_access_descriptor;

    /// Max Disconnected server pipes cached for reuse.  Default: twice the hardware concurrency.
    size_t m_pool_capacity;

    /// Per loop, how many consecutive transient connection faults are tolerated; 0 (default) means no limit.
    size_t m_max_consecutive_transient_faults;

    /// Where the Exclusivity_guard lock file lives.  Default: `/var/run`.
    fs::path m_lock_dir;

    // Constructors/destructor.

    /// Sets the defaults.
    Options();
  }; // struct Options

  // Constructors/destructor.

  /**
   * Constructs the listener (not started) with the default server pipe factory: Local_server_pipe_factory.
   * On error the listener is unusable: start() fails with error::Code::S_LISTENER_STOPPED; accept() reports the
   * error.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param absolute_name
   *        The pipe name.  Must be non-empty and sanitize()able (see util::Shared_name).
   * @param opts
   *        Configuration.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (bad name or options); whatever Exclusivity_guard emits.
   */
  explicit Pipe_listener(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                         const Options& opts = Options(), Error_code* err_code = 0);

  /**
   * Same as the other ctor, but with a custom server pipe factory; e.g., a test double.
   *
   * @param logger_ptr
   *        See other ctor.
   * @param absolute_name
   *        See other ctor.
   * @param opts
   *        See other ctor.
   * @param factory
   *        Creates Reserved server pipes.  If empty, Local_server_pipe_factory is used.
   * @param err_code
   *        See other ctor.
   */
  explicit Pipe_listener(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                         const Options& opts, Server_pipe_factory&& factory, Error_code* err_code = 0);

  /// Equivalent to stop().
  ~Pipe_listener();

  // Methods.

  /**
   * Acquires the initial K server pipes, then starts the K loops.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_LISTENER_ALREADY_STARTED, error::Code::S_LISTENER_STOPPED, whatever the server pipe
   *        factory emits (e.g., `boost::asio::error::address_in_use`, error::Code::S_INVALID_ACCESS_DESCRIPTOR).
   *        On a factory error no loop is started; start() may be retried.
   */
  void start(Error_code* err_code = 0);

  /**
   * Blocks until a connection is available and returns it; or returns null at end-of-stream.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        the fault that stopped the listener, if it was stopped by a fault.
   * @return Non-null connection, already started; or null.  Null with no error means stopped normally.
   */
  Pipe_connection_ptr accept(Error_code* err_code = 0);

  /**
   * Same as the other accept(), but interruptible via `cancel`; then error::Code::S_INTERRUPTED is emitted.
   * The listener itself is unaffected by `cancel`.
   *
   * @param cancel
   *        Caller's cancellation signal.
   * @param err_code
   *        See other accept().  Also: error::Code::S_INTERRUPTED.
   * @return See other accept().
   */
  Pipe_connection_ptr accept(const util::Cancel_signal& cancel, Error_code* err_code = 0);

  /// Shuts down; see class doc header.  Idempotent; blocks until the loops have exited.
  void stop();

  /**
   * The sanitized pipe name.
   * @return See above.
   */
  const util::Shared_name& absolute_name() const;

  /**
   * The access descriptor in effect, as resolved from Options.
   * @return See above.
   */
  const Access_descriptor& access_descriptor() const;

  /**
   * Options as passed to ctor.
   * @return See above.
   */
  const Options& options() const;

  /**
   * Whether start() has succeeded.
   * @return See above.
   */
  bool started() const;

  /**
   * Whether stop() has been called or the ctor failed.
   * @return See above.
   */
  bool stopped() const;

private:
  // Types.

  /// The accept queue type.
  using Queue = Accept_queue<Pipe_connection_ptr>;

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * The access descriptor Options call for.
   *
   * @param opts
   *        Options.
   * @return See above.
   */
  static Access_descriptor resolve_access_descriptor(const Options& opts);

  // Data.

  /// See absolute_name().
  util::Shared_name m_absolute_name;

  /// See options().
  const Options m_opts;

  /// See access_descriptor().
  const Access_descriptor m_access;

  /// Per-connection buffering, from #m_opts.
  const Connection_buffer_config m_buf_cfg;

  /// Triggered by stop(); observed by all the loops.
  util::Cancel_signal m_cancel;

  /// The accept queue.  Always non-null.
  const boost::shared_ptr<Queue> m_queue;

  /// Null if the ctor failed before acquiring it.
  boost::movelib::unique_ptr<Exclusivity_guard> m_guard;

  /// Null if the ctor failed before creating it.  Shared with the loops and the connections' returners.
  boost::shared_ptr<Server_pipe_pool> m_pool;

  /// Protects the below.
  mutable Mutex m_lifecycle_mutex;

  /// The loops; empty until start().
  std::vector<boost::movelib::unique_ptr<detail::Listener_loop>> m_loops;

  /// See started().
  bool m_started;

  /// See stopped().
  bool m_stopped;

  /// Whether stop() has executed.
  bool m_stop_executed;
}; // class Pipe_listener

} // namespace npipe::transport
