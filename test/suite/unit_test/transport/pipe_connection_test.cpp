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

#include "npipe/transport/pipe_connection.hpp"
#include "npipe/transport/error.hpp"
#include "npipe/test/fake_server_pipe.hpp"
#include "npipe/test/test_logger.hpp"
#include "npipe/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/thread/future.hpp>
#include <boost/make_shared.hpp>
#include <boost/chrono.hpp>
#include <boost/thread/thread.hpp>
#include <sys/socket.h>
#include <unistd.h>
#include <string>
#include <vector>

namespace npipe::transport::test
{

namespace
{

using npipe::test::Fake_pipe_script;
using npipe::test::Test_logger;

/// Result of an async_read_some().
struct Read_result
{
  Error_code m_err_code;
  size_t m_n_read;
};

/// A connection over a fake connected pipe, plus the client end and the pipe as given back at close.
class Connection_fixture
{
public:
  explicit Connection_fixture(const Connection_buffer_config& buf_cfg = { Stream_buffer_config::unbounded(),
                                                                         Stream_buffer_config::unbounded() }) :
    m_script(boost::make_shared<Fake_pipe_script>()),
    m_n_returned(0)
  {
    auto pipe = m_script->factory()(nullptr);
    m_script->push_connect();
    const util::Cancel_signal never;
    pipe->wait_for_connection(never);
    m_client = m_script->take_client();

    m_conn.reset(new Pipe_connection(&m_logger, "conn", std::move(pipe), buf_cfg,
                                     [this](Server_pipe_ptr&& returned)
    {
      ++m_n_returned;
      m_returned_connected = returned->connected();
      m_returned = std::move(returned);
    }));
    m_conn->start();
  }

  ~Connection_fixture()
  {
    m_conn.reset();
    ::close(m_client.m_native_handle);
  }

  Read_result read_some(std::vector<uint8_t>* buf)
  {
    boost::promise<Read_result> done;
    auto done_future = done.get_future();
    m_conn->async_read_some(util::Blob_mutable(buf->data(), buf->size()),
                            [&](const Error_code& err_code, size_t n_read)
    {
      done.set_value(Read_result{ err_code, n_read });
    });
    return done_future.get();
  }

  void client_write(const std::string& str)
  {
    ASSERT_EQ(::write(m_client.m_native_handle, str.data(), str.size()), ssize_t(str.size()));
  }

  std::string client_read_exactly(size_t n)
  {
    std::string result(n, '\0');
    size_t done = 0;
    while (done != n)
    {
      const auto n_rcvd = ::read(m_client.m_native_handle, &result[done], n - done);
      if (n_rcvd <= 0)
      {
        break;
      }
      done += size_t(n_rcvd);
    }
    result.resize(done);
    return result;
  }

  Test_logger m_logger;
  boost::shared_ptr<Fake_pipe_script> m_script;
  util::Native_handle m_client;
  boost::movelib::unique_ptr<Pipe_connection> m_conn;
  int m_n_returned;
  bool m_returned_connected = true;
  Server_pipe_ptr m_returned;
}; // class Connection_fixture

} // namespace (anon)

TEST(Stream_buffer_config_test, From_max_buffer_size)
{
  const auto unbounded = Stream_buffer_config::from_max_buffer_size(0);
  EXPECT_FALSE(unbounded.bounded());
  EXPECT_FALSE(Stream_buffer_config::unbounded().bounded());

  const auto cfg = Stream_buffer_config::from_max_buffer_size(65536);
  EXPECT_TRUE(cfg.bounded());
  EXPECT_EQ(cfg.m_pause_threshold, 65536u);
  EXPECT_EQ(cfg.m_resume_threshold, 32768u);
}

TEST(Pipe_connection_test, Echo)
{
  Connection_fixture fix;
  EXPECT_EQ(fix.m_conn->remote_peer_process_credentials(), npipe::test::get_process_creds());

  fix.client_write("hello");
  std::vector<uint8_t> buf(64);
  std::string rcvd;
  while (rcvd.size() < 5)
  {
    const auto result = fix.read_some(&buf);
    ASSERT_FALSE(result.m_err_code);
    rcvd.append(reinterpret_cast<const char*>(buf.data()), result.m_n_read);
  }
  EXPECT_EQ(rcvd, "hello");

  boost::promise<Error_code> written;
  auto written_future = written.get_future();
  fix.m_conn->async_write(util::Blob_const(rcvd.data(), rcvd.size()),
                          [&](const Error_code& err_code) { written.set_value(err_code); });
  EXPECT_FALSE(written_future.get());
  EXPECT_EQ(fix.client_read_exactly(5), "hello");
}

TEST(Pipe_connection_test, Peer_close_gives_eof)
{
  Connection_fixture fix;
  fix.client_write("ab");
  ::shutdown(fix.m_client.m_native_handle, SHUT_WR);

  std::vector<uint8_t> buf(1);
  std::string rcvd;
  Read_result result;
  while (!(result = fix.read_some(&buf)).m_err_code)
  {
    rcvd.append(reinterpret_cast<const char*>(buf.data()), result.m_n_read);
  }
  EXPECT_EQ(rcvd, "ab");
  EXPECT_EQ(result.m_err_code, boost::asio::error::eof);
}

TEST(Pipe_connection_test, Close_returns_disconnected_pipe_and_aborts_handlers)
{
  Connection_fixture fix;

  std::vector<uint8_t> buf(16);
  boost::promise<Error_code> read_done;
  auto read_future = read_done.get_future();
  fix.m_conn->async_read_some(util::Blob_mutable(buf.data(), buf.size()),
                              [&](const Error_code& err_code, size_t) { read_done.set_value(err_code); });

  fix.m_conn->close();
  EXPECT_EQ(read_future.get(), error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);
  EXPECT_EQ(fix.m_n_returned, 1);
  EXPECT_FALSE(fix.m_returned_connected);

  fix.m_conn->close(); // Idempotent.
  EXPECT_EQ(fix.m_n_returned, 1);

  Error_code late_err;
  fix.m_conn->async_write(util::Blob_const(buf.data(), 1), [&](const Error_code& err_code) { late_err = err_code; });
  EXPECT_EQ(late_err, error::Code::S_CONNECTION_CLOSED);
}

TEST(Pipe_connection_test, Input_buffer_pauses_reading)
{
  const size_t MAX = 16;
  Connection_fixture fix({ Stream_buffer_config::from_max_buffer_size(MAX), Stream_buffer_config::unbounded() });

  const std::string PAYLOAD(100, 'x');
  fix.client_write(PAYLOAD);

  // Reader thread fills the buffer up to the pause threshold, and no further.
  for (int idx = 0; (idx != 200) && (fix.m_conn->input_buffered() < MAX); ++idx)
  {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(5));
  }
  boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
  EXPECT_EQ(fix.m_conn->input_buffered(), MAX);

  // Draining lets the rest through.
  std::vector<uint8_t> buf(7);
  size_t total = 0;
  while (total < PAYLOAD.size())
  {
    const auto result = fix.read_some(&buf);
    ASSERT_FALSE(result.m_err_code);
    total += result.m_n_read;
    EXPECT_LE(fix.m_conn->input_buffered(), MAX);
  }
  EXPECT_EQ(total, PAYLOAD.size());
}

TEST(Pipe_connection_test, Write_completion_deferred_until_output_drains)
{
  const size_t MAX = 1024;
  Connection_fixture fix({ Stream_buffer_config::unbounded(), Stream_buffer_config::from_max_buffer_size(MAX) });

  // Much more than the socket pair's kernel buffers can hold, so it stays buffered while nobody reads.
  const std::string PAYLOAD(8 * 1024 * 1024, 'y');
  boost::promise<Error_code> written;
  auto written_future = written.get_future();
  fix.m_conn->async_write(util::Blob_const(PAYLOAD.data(), PAYLOAD.size()),
                          [&](const Error_code& err_code) { written.set_value(err_code); });

  EXPECT_EQ(written_future.wait_for(boost::chrono::milliseconds(200)), boost::future_status::timeout);
  EXPECT_GT(fix.m_conn->output_buffered(), MAX);

  const auto rcvd = fix.client_read_exactly(PAYLOAD.size());
  EXPECT_EQ(rcvd.size(), PAYLOAD.size());
  EXPECT_FALSE(written_future.get());
}

} // namespace npipe::transport::test
