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
#include "npipe/transport/pipe_connection.hpp"
#include "npipe/transport/asio_local_stream_socket.hpp"
#include "npipe/transport/error.hpp"
#include <flow/async/util.hpp>
#include <flow/error/error.hpp>
#include <unistd.h>
#include <vector>

namespace npipe::transport
{

namespace
{

/// Max bytes requested from the kernel per socket read.
constexpr size_t S_READ_CHUNK_SIZE = 64 * 1024;

} // namespace (anon)

// Stream_buffer_config implementations.

Stream_buffer_config Stream_buffer_config::from_max_buffer_size(size_t max_size) // Static.
{
  return Stream_buffer_config{ max_size, max_size / 2 };
}

Stream_buffer_config Stream_buffer_config::unbounded() // Static.
{
  return from_max_buffer_size(0);
}

bool Stream_buffer_config::bounded() const
{
  return m_pause_threshold != 0;
}

std::ostream& operator<<(std::ostream& os, const Stream_buffer_config& val)
{
  if (!val.bounded())
  {
    return os << "bufcfg[unbounded]";
  }
  // else
  return os << "bufcfg[pause " << val.m_pause_threshold << " resume " << val.m_resume_threshold << ']';
}

// Pipe_connection implementations.

Pipe_connection::Pipe_connection(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                 Server_pipe_ptr&& pipe, const Connection_buffer_config& buf_cfg,
                                 Server_pipe_returner&& returner) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_buf_cfg(buf_cfg),
  m_peer_creds(pipe->peer_process_credentials()),
  m_pipe(std::move(pipe)),
  m_returner(std::move(returner)),
  m_closed(false),
  m_started(false),
  // (Linux) OS thread name will truncate this to 15 chars; good enough.
  m_worker(get_logger(), flow::util::ostream_op_string("Conn-", m_nickname)),
  m_in_buffered(0),
  m_out_buffered(0),
  m_reading(false),
  m_read_paused(false),
  m_flushing(false)
{
  assert(m_pipe && m_pipe->connected());
  FLOW_LOG_TRACE("Connection [" << *this << "]: Created over [" << *m_pipe << "]; peer [" << m_peer_creds << "]; "
                 "input [" << m_buf_cfg.m_input << "], output [" << m_buf_cfg.m_output << "].");
}

Pipe_connection::~Pipe_connection()
{
  close();
}

void Pipe_connection::start(Error_code* err_code)
{
  using asio_local_stream_socket::Protocol;
  using flow::async::reset_this_thread_pinning;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { start(actual_err_code); },
         err_code, "Pipe_connection::start()"))
  {
    return;
  }
  // else
  err_code->clear();

  assert((!m_started) && "Call start() at most once.");

  auto hndl = m_pipe->release_peer_handle();
  if (hndl.null())
  {
    FLOW_LOG_WARNING("Connection [" << *this << "]: Server pipe has no peer handle to adopt.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  m_worker.start(reset_this_thread_pinning); // Don't inherit any strange core-affinity.
  m_started = true;

  m_peer.emplace(*(m_worker.task_engine()));
  m_peer->assign(Protocol(), hndl.m_native_handle, *err_code);
  if (*err_code)
  {
    ::close(hndl.m_native_handle);
    FLOW_LOG_WARNING("Connection [" << *this << "]: Could not adopt peer handle [" << hndl << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  FLOW_LOG_TRACE("Connection [" << *this << "]: Started on [" << hndl << "].");
  m_worker.post([this]() { start_reading(); });
} // Pipe_connection::start()

void Pipe_connection::async_read_some(const util::Blob_mutable& target, Read_handler&& on_done_func)
{
  if (m_closed)
  {
    on_done_func(error::Code::S_CONNECTION_CLOSED, 0);
    return;
  }
  // else
  assert(m_started);

  m_worker.post([this, target, on_done_func = std::move(on_done_func)]() mutable
  {
    if (m_closed)
    {
      on_done_func(error::Code::S_CONNECTION_CLOSED, 0);
      return;
    }
    // else
    assert((!m_pending_read) && "At most one async_read_some() may be outstanding.");
    m_pending_read = Pending_read{ target, std::move(on_done_func) };
    serve_pending_read();
  });
}

void Pipe_connection::async_write(const util::Blob_const& data, Write_handler&& on_done_func)
{
  using std::vector;

  if (m_closed)
  {
    on_done_func(error::Code::S_CONNECTION_CLOSED);
    return;
  }
  // else
  assert(m_started);

  const auto data_ptr = util::blob_data(data);
  m_worker.post([this, bytes = vector<uint8_t>(data_ptr, data_ptr + data.size()),
                 on_done_func = std::move(on_done_func)]() mutable
  {
    using boost::asio::buffer;
    using boost::asio::buffer_copy;

    if (m_closed)
    {
      on_done_func(error::Code::S_CONNECTION_CLOSED);
      return;
    }
    if (m_write_err_code)
    {
      on_done_func(m_write_err_code);
      return;
    }
    // else

    m_out_buf.commit(buffer_copy(m_out_buf.prepare(bytes.size()), buffer(bytes)));
    m_out_buffered = m_out_buf.size();
    start_flushing();

    const auto& cfg = m_buf_cfg.m_output;
    if ((!m_deferred_writes.empty()) || (cfg.bounded() && (m_out_buf.size() >= cfg.m_pause_threshold)))
    {
      FLOW_LOG_TRACE("Connection [" << *this << "]: Output buffer at [" << m_out_buf.size() << "] bytes; "
                     "deferring write completion until it drains to [" << cfg.m_resume_threshold << "].");
      m_deferred_writes.emplace(std::move(on_done_func));
      return;
    }
    // else
    on_done_func(Error_code());
  });
} // Pipe_connection::async_write()

void Pipe_connection::start_reading()
{
  using std::min;

  if (m_reading || m_read_paused || m_read_err_code || (!m_peer) || (!m_peer->is_open()))
  {
    return;
  }
  // else

  auto n = S_READ_CHUNK_SIZE;
  const auto& cfg = m_buf_cfg.m_input;
  if (cfg.bounded())
  {
    const auto size = m_in_buf.size();
    if (size >= cfg.m_pause_threshold)
    {
      FLOW_LOG_TRACE("Connection [" << *this << "]: Input buffer full at [" << size << "] bytes; pausing reads "
                     "until it drains to [" << cfg.m_resume_threshold << "].");
      m_read_paused = true;
      return;
    }
    // else
    n = min(n, cfg.m_pause_threshold - size);
  }

  m_reading = true;
  m_peer->async_read_some(m_in_buf.prepare(n),
                          [this](const Error_code& err_code, size_t n_rcvd) { on_read(err_code, n_rcvd); });
}

void Pipe_connection::on_read(const Error_code& err_code, size_t n_rcvd)
{
  m_reading = false;
  if (err_code)
  {
    if (err_code == boost::asio::error::operation_aborted)
    {
      return; // close() in progress.
    }
    // else
    m_read_err_code = err_code;
    if (err_code == boost::asio::error::eof)
    {
      FLOW_LOG_TRACE("Connection [" << *this << "]: Peer closed its end.");
    }
    else
    {
      FLOW_LOG_WARNING("Connection [" << *this << "]: Read from peer failed: [" << err_code << "] "
                       "[" << err_code.message() << "].");
    }
  }
  else
  {
    m_in_buf.commit(n_rcvd);
    m_in_buffered = m_in_buf.size();
  }

  serve_pending_read();
  start_reading();
}

void Pipe_connection::serve_pending_read()
{
  using boost::asio::buffer_copy;

  if ((!m_pending_read) || ((m_in_buf.size() == 0) && (!m_read_err_code)))
  {
    return;
  }
  // else

  auto pending = std::move(*m_pending_read);
  m_pending_read.reset();

  if (m_in_buf.size() == 0)
  {
    pending.m_on_done_func(m_read_err_code, 0);
    return;
  }
  // else

  const auto n = buffer_copy(pending.m_target, m_in_buf.data());
  m_in_buf.consume(n);
  m_in_buffered = m_in_buf.size();

  if (m_read_paused && (m_in_buf.size() <= m_buf_cfg.m_input.m_resume_threshold))
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Input buffer drained to [" << m_in_buf.size() << "] bytes; "
                   "resuming reads.");
    m_read_paused = false;
    start_reading();
  }

  pending.m_on_done_func(Error_code(), n);
}

void Pipe_connection::start_flushing()
{
  if (m_flushing || m_write_err_code || (m_out_buf.size() == 0) || (!m_peer) || (!m_peer->is_open()))
  {
    return;
  }
  // else

  m_flushing = true;
  m_peer->async_write_some(m_out_buf.data(),
                           [this](const Error_code& err_code, size_t n_sent) { on_flushed(err_code, n_sent); });
}

void Pipe_connection::on_flushed(const Error_code& err_code, size_t n_sent)
{
  m_flushing = false;
  if (err_code)
  {
    if (err_code == boost::asio::error::operation_aborted)
    {
      return; // close() in progress.
    }
    // else
    FLOW_LOG_WARNING("Connection [" << *this << "]: Write to peer failed: [" << err_code << "] "
                     "[" << err_code.message() << "]; [" << m_out_buf.size() << "] bytes unsent.  Write direction "
                     "is broken.");
    m_write_err_code = err_code;
    fire_deferred_writes(m_write_err_code);
    return;
  }
  // else

  m_out_buf.consume(n_sent);
  m_out_buffered = m_out_buf.size();

  const auto& cfg = m_buf_cfg.m_output;
  if ((!m_deferred_writes.empty()) && ((!cfg.bounded()) || (m_out_buf.size() <= cfg.m_resume_threshold)))
  {
    FLOW_LOG_TRACE("Connection [" << *this << "]: Output buffer drained to [" << m_out_buf.size() << "] bytes; "
                   "completing [" << m_deferred_writes.size() << "] deferred writes.");
    fire_deferred_writes(Error_code());
  }

  start_flushing();
}

void Pipe_connection::fire_deferred_writes(const Error_code& err_code)
{
  // Swap out first: a handler may issue another async_write(), which lands (via post()) in a fresh queue.
  std::queue<Write_handler> handlers;
  handlers.swap(m_deferred_writes);
  while (!handlers.empty())
  {
    handlers.front()(err_code);
    handlers.pop();
  }
}

util::Process_credentials Pipe_connection::remote_peer_process_credentials() const
{
  return m_peer_creds;
}

void Pipe_connection::close()
{
  using flow::async::Single_thread_task_loop;
  using flow::async::reset_thread_pinning;
  using flow::util::ostream_op_string;

  if (m_closed.exchange(true))
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Connection [" << *this << "]: Closing.  About [" << m_in_buffered << "] bytes unread; "
                "[" << m_out_buffered << "] bytes unsent.");

  if (m_started)
  {
    // Thread W is no more after this.
    m_worker.stop();

    /* Run the tasks post()ed but not yet executed, as-if they ran just before close() (they see m_closed and
     * fail their handlers).  Then fail whatever is still pending.  Use a transient thread, so as to not invoke
     * handlers from the caller's thread. */
    Single_thread_task_loop one_thread(get_logger(), ostream_op_string("ConnDeinit-", m_nickname));
    one_thread.start([&]()
    {
      reset_thread_pinning(get_logger());

      const auto task_engine = m_worker.task_engine();
      task_engine->restart();
      const auto count = task_engine->poll();
      if (count != 0)
      {
        FLOW_LOG_TRACE("Connection [" << *this << "]: Ran [" << count << "] queued tasks during close.");
      }
      task_engine->stop();

      if (m_peer)
      {
        Error_code sys_err_code;
        m_peer->close(sys_err_code);
        if (sys_err_code)
        {
          FLOW_LOG_WARNING("Connection [" << *this << "]: Closing peer socket reported error; details logged "
                           "below.");
          FLOW_ERROR_SYS_ERROR_LOG_WARNING();
        }
      }

      const Error_code aborted_err_code = error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER;
      if (m_pending_read)
      {
        auto pending = std::move(*m_pending_read);
        m_pending_read.reset();
        pending.m_on_done_func(aborted_err_code, 0);
      }
      fire_deferred_writes(aborted_err_code);
    }); // one_thread.start()
  } // if (m_started)

  if (m_pipe)
  {
    m_pipe->disconnect();
    if (m_returner)
    {
      FLOW_LOG_TRACE("Connection [" << *this << "]: Returning [" << *m_pipe << "].");
      m_returner(std::move(m_pipe));
    }
    m_pipe.reset();
  }
} // Pipe_connection::close()

const std::string& Pipe_connection::nickname() const
{
  return m_nickname;
}

size_t Pipe_connection::input_buffered() const
{
  return m_in_buffered;
}

size_t Pipe_connection::output_buffered() const
{
  return m_out_buffered;
}

std::ostream& operator<<(std::ostream& os, const Pipe_connection& val)
{
  return os << "pipe_conn[" << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace npipe::transport
