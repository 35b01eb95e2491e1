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
#include "npipe/transport/asio_local_stream_socket_fwd.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <boost/asio/streambuf.hpp>
#include <optional>
#include <queue>
#include <atomic>

namespace npipe::transport
{

// Types.

/**
 * Flow-control thresholds of one direction of a Pipe_connection.  Once the buffered byte count reaches
 * #m_pause_threshold, the producing side is paused; it resumes once the count falls to #m_resume_threshold or below.
 * A #m_pause_threshold of 0 means unbounded: never pause.
 */
struct Stream_buffer_config
{
  // Data.

  /// Pause at this many buffered bytes; 0 means never.
  size_t m_pause_threshold;

  /// Resume at this many buffered bytes or fewer.
  size_t m_resume_threshold;

  // `static` ctors.

  /**
   * The config derived from a maximum buffer size: unbounded if 0; else pause at `max_size` and resume at half that.
   *
   * @param max_size
   *        Max buffer size; 0 for unbounded.
   * @return See above.
   */
  static Stream_buffer_config from_max_buffer_size(size_t max_size);

  /**
   * Equivalent to `from_max_buffer_size(0)`.
   * @return See above.
   */
  static Stream_buffer_config unbounded();

  // Methods.

  /**
   * `m_pause_threshold != 0`.
   * @return See above.
   */
  bool bounded() const;
}; // struct Stream_buffer_config

/// The configs of both directions of a Pipe_connection.
struct Connection_buffer_config
{
  /// Bytes received from the peer but not yet read by the application.
  Stream_buffer_config m_input;

  /// Bytes written by the application but not yet handed to the kernel.
  Stream_buffer_config m_output;
};

/**
 * An accepted connection: a bidirectional byte stream over a Connected Server_pipe, as emitted by
 * Pipe_listener::accept().  It owns the server pipe instance until close() (or destruction), at which point the
 * pipe is disconnected and given back to the pipe pool via the Server_pipe_returner.
 *
 * ### Buffering ###
 * A worker thread W (started by start()) reads from the peer into an input buffer as long as it is below the input
 * pause threshold, and flushes the output buffer to the peer as fast as the kernel allows.  async_read_some()
 * takes bytes from the input buffer.  async_write() appends to the output buffer; its completion handler is
 * deferred while the output buffer is at or above the output pause threshold, until it drains to the resume
 * threshold.  So a slow reader on either side applies back-pressure, up to the configured bounds.
 *
 * ### Handlers ###
 * Completion handlers execute in thread W, or (on close()) in an unspecified thread other than the caller's.  At
 * most one async_read_some() may be outstanding at a time.  close() must not be called from a handler.  After
 * close(), handlers still pending are invoked with error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER, and
 * further async ops complete with error::Code::S_CONNECTION_CLOSED.
 */
class Pipe_connection :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Handler for async_read_some(): error (falsy on success) and bytes copied.
  using Read_handler = Function<void (const Error_code& err_code, size_t n_read)>;

  /// Handler for async_write().
  using Write_handler = Function<void (const Error_code& err_code)>;

  // Constructors/destructor.

  /**
   * Takes over a Connected server pipe; does not yet touch its peer handle (see start()).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname, for logging and the worker thread name.
   * @param pipe
   *        Connected server pipe.  Becomes null.
   * @param buf_cfg
   *        Flow-control settings.
   * @param returner
   *        Invoked with the (disconnected) pipe at close().  May be empty: then the pipe is destroyed.
   */
  explicit Pipe_connection(flow::log::Logger* logger_ptr, util::String_view nickname_str, Server_pipe_ptr&& pipe,
                           const Connection_buffer_config& buf_cfg, Server_pipe_returner&& returner);

  /// Equivalent to close().
  ~Pipe_connection();

  // Methods.

  /**
   * Starts thread W and begins reading from the peer.  Call at most once.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (the pipe's peer handle was already ejected), system codes from adopting
   *        the handle.
   */
  void start(Error_code* err_code = 0);

  /**
   * Copies up to `target.size()` buffered input bytes into `target`, waiting for at least one if none are buffered.
   * On end of input the handler gets `boost::asio::error::eof`, or whatever error ended the read direction.
   *
   * @param target
   *        Must stay valid until the handler is invoked.
   * @param on_done_func
   *        Completion handler.
   */
  void async_read_some(const util::Blob_mutable& target, Read_handler&& on_done_func);

  /**
   * Copies `data` into the output buffer (so `data` may be reused immediately) and schedules its transmission.
   * The handler is invoked once the output buffer is below the pause threshold (immediately, if it is), or with
   * the error that broke the write direction.
   *
   * @param data
   *        Bytes to send.
   * @param on_done_func
   *        Completion handler.
   */
  void async_write(const util::Blob_const& data, Write_handler&& on_done_func);

  /**
   * Credentials of the peer as of connection.
   * @return See above.
   */
  util::Process_credentials remote_peer_process_credentials() const;

  /**
   * Stops thread W, closes the peer socket, fails pending handlers (see class doc header), disconnects the server
   * pipe and gives it to the returner.  Idempotent.
   */
  void close();

  /**
   * Nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Bytes buffered from the peer, not yet read.  Approximate if called outside thread W.
   * @return See above.
   */
  size_t input_buffered() const;

  /**
   * Bytes buffered for the peer, not yet sent.  Approximate if called outside thread W.
   * @return See above.
   */
  size_t output_buffered() const;

private:
  // Types.

  /// A not-yet-served async_read_some().
  struct Pending_read
  {
    /// See async_read_some().
    util::Blob_mutable m_target;

    /// See async_read_some().
    Read_handler m_on_done_func;
  };

  // Methods.

  /// In thread W: issues the next socket read, unless one is outstanding, the direction is done, or paused.
  void start_reading();

  /**
   * In thread W: completion of a socket read.
   *
   * @param err_code
   *        Result.
   * @param n_rcvd
   *        Bytes read.
   */
  void on_read(const Error_code& err_code, size_t n_rcvd);

  /// In thread W: serves #m_pending_read if it can be served; resumes reading if the buffer drained enough.
  void serve_pending_read();

  /// In thread W: issues the next socket write, unless one is outstanding, nothing is buffered, or it broke.
  void start_flushing();

  /**
   * In thread W: completion of a socket write.
   *
   * @param err_code
   *        Result.
   * @param n_sent
   *        Bytes written.
   */
  void on_flushed(const Error_code& err_code, size_t n_sent);

  /**
   * Invokes and clears all #m_deferred_writes.
   *
   * @param err_code
   *        To pass to each.
   */
  void fire_deferred_writes(const Error_code& err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  const Connection_buffer_config m_buf_cfg;

  /// See remote_peer_process_credentials().
  const util::Process_credentials m_peer_creds;

  /// The server pipe, until close().
  Server_pipe_ptr m_pipe;

  /// See ctor.
  Server_pipe_returner m_returner;

  /// Whether close() has been called.
  std::atomic<bool> m_closed;

  /// Whether start() has been called.
  bool m_started;

  /// Thread W.  Declared ahead of #m_peer: the socket must be destroyed before its event loop.
  flow::async::Single_thread_task_loop m_worker;

  /// The peer socket; emplaced by start(); touched only in thread W thereafter.
  std::optional<asio_local_stream_socket::Peer_socket> m_peer;

  /// Input buffer.
  boost::asio::streambuf m_in_buf;

  /// Output buffer.
  boost::asio::streambuf m_out_buf;

  /// Mirror of `m_in_buf.size()` for input_buffered().
  std::atomic<size_t> m_in_buffered;

  /// Mirror of `m_out_buf.size()` for output_buffered().
  std::atomic<size_t> m_out_buffered;

  /// Whether a socket read is outstanding.
  bool m_reading;

  /// Whether reading is paused due to a full input buffer.
  bool m_read_paused;

  /// The error (incl. `eof`) that ended the read direction; falsy if not ended.
  Error_code m_read_err_code;

  /// The outstanding async_read_some(), if any.
  std::optional<Pending_read> m_pending_read;

  /// Whether a socket write is outstanding.
  bool m_flushing;

  /// The error that broke the write direction; falsy if not broken.
  Error_code m_write_err_code;

  /// async_write() handlers awaiting output drain, in order of the calls.
  std::queue<Write_handler> m_deferred_writes;
}; // class Pipe_connection

} // namespace npipe::transport
