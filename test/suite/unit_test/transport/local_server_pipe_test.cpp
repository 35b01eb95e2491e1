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

#include "npipe/transport/pipe_listener.hpp"
#include "npipe/transport/local_server_pipe.hpp"
#include "npipe/transport/detail/asio_local_stream_socket_fwd.hpp"
#include "npipe/transport/error.hpp"
#include "npipe/test/test_logger.hpp"
#include "npipe/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <boost/thread/future.hpp>
#include <boost/chrono.hpp>
#include <algorithm>
#include <string>

namespace npipe::transport::test
{

namespace
{

using npipe::test::Test_logger;
using npipe::test::Temp_dir;
using npipe::test::unique_pipe_name;
namespace asio_local = asio_local_stream_socket;

/// A blocking client connected to the given name.
class Client
{
public:
  explicit Client(flow::log::Logger* logger_ptr, const util::Shared_name& name) :
    m_sock(m_io)
  {
    m_sock.connect(asio_local::endpoint_at_shared_name(logger_ptr, name));
  }

  void send(const std::string& str)
  {
    boost::asio::write(m_sock, boost::asio::buffer(str));
  }

  std::string receive(size_t n, Error_code* err_code)
  {
    std::string result(n, '\0');
    const auto n_rcvd = boost::asio::read(m_sock, boost::asio::buffer(&result[0], n), *err_code);
    result.resize(n_rcvd);
    return result;
  }

private:
  boost::asio::io_context m_io;
  asio_local::Peer_socket m_sock;
}; // class Client

/// Reads exactly `n` bytes from the connection.
std::string read_exactly(Pipe_connection* conn, size_t n)
{
  std::string result;
  char buf[64];
  while (result.size() < n)
  {
    boost::promise<size_t> done;
    auto done_future = done.get_future();
    conn->async_read_some(util::Blob_mutable(buf, std::min(sizeof(buf), n - result.size())),
                          [&](const Error_code& err_code, size_t n_read)
    {
      done.set_value(err_code ? 0 : n_read);
    });
    const auto n_read = done_future.get();
    if (n_read == 0)
    {
      break;
    }
    result.append(buf, n_read);
  }
  return result;
}

} // namespace (anon)

TEST(Local_server_pipe_test, Echo_through_listener)
{
  Test_logger logger;
  const Temp_dir lock_dir;
  const auto name = unique_pipe_name("echo");

  Pipe_listener::Options opts;
  opts.m_lock_dir = lock_dir.path();
  opts.m_restrict_to_current_user = true;
  Pipe_listener lsn(&logger, name, opts);
  lsn.start();

  Client client(&logger, name);
  auto conn = lsn.accept();
  ASSERT_TRUE(conn);
  EXPECT_EQ(conn->remote_peer_process_credentials(), npipe::test::get_process_creds());

  client.send("ping");
  const auto rcvd = read_exactly(conn.get(), 4);
  EXPECT_EQ(rcvd, "ping");

  boost::promise<Error_code> written;
  auto written_future = written.get_future();
  conn->async_write(util::Blob_const(rcvd.data(), rcvd.size()),
                    [&](const Error_code& err_code) { written.set_value(err_code); });
  EXPECT_FALSE(written_future.get());

  Error_code err_code;
  EXPECT_EQ(client.receive(4, &err_code), "ping");
  EXPECT_FALSE(err_code);

  // Server side closes; the client sees end-of-stream.
  conn.reset();
  client.receive(1, &err_code);
  EXPECT_EQ(err_code, boost::asio::error::eof);
}

TEST(Local_server_pipe_test, Parallel_clients)
{
  Test_logger logger;
  const Temp_dir lock_dir;
  const auto name = unique_pipe_name("par");

  Pipe_listener::Options opts;
  opts.m_lock_dir = lock_dir.path();
  opts.m_listener_parallelism = 2;
  Pipe_listener lsn(&logger, name, opts);
  lsn.start();

  Client client1(&logger, name);
  Client client2(&logger, name);
  Client client3(&logger, name); // Waits in the kernel backlog until an instance is free.
  auto conn1 = lsn.accept();
  auto conn2 = lsn.accept();
  auto conn3 = lsn.accept();
  EXPECT_TRUE(conn1 && conn2 && conn3);

  lsn.stop();
}

TEST(Local_server_pipe_test, Unpermitted_peer_is_refused)
{
  Test_logger logger;
  const Temp_dir lock_dir;
  const auto name = unique_pipe_name("deny");

  // Owned by some user and group that are not ours.
  const auto& own = npipe::test::get_process_creds();
  Access_descriptor access{ util::Permissions_level::S_USER_ACCESS, own.user_id() + 12345, own.group_id() + 12345 };

  Pipe_listener::Options opts;
  opts.m_lock_dir = lock_dir.path();
  opts.m_access_descriptor = access;
  Pipe_listener lsn(&logger, name, opts);
  lsn.start();

  Client client(&logger, name);
  Error_code err_code;
  client.receive(1, &err_code); // Server hangs up on us.
  EXPECT_TRUE((err_code == boost::asio::error::eof) || (err_code == boost::asio::error::connection_reset));

  // Nothing was published; the listener is still fine.
  util::Cancel_signal cancel;
  boost::thread canceler([&]()
  {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(100));
    cancel.cancel();
  });
  EXPECT_FALSE(lsn.accept(cancel, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INTERRUPTED);
  canceler.join();
  EXPECT_FALSE(lsn.stopped());
}

TEST(Local_server_pipe_test, Invalid_access_descriptor)
{
  Test_logger logger;
  const Access_descriptor access{ util::Permissions_level::S_END_SENTINEL, 0, 0 };
  Local_server_pipe_factory factory(&logger, unique_pipe_name("badacc"), access);

  Error_code err_code;
  EXPECT_FALSE(factory.create(&err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ACCESS_DESCRIPTOR);
}

TEST(Local_server_pipe_test, Name_bound_while_any_instance_lives)
{
  Test_logger logger;
  const auto name = unique_pipe_name("bound");
  const auto access = Access_descriptor::unrestricted();

  Local_server_pipe_factory factory1(&logger, name, access);
  Local_server_pipe_factory factory2(&logger, name, access);

  Error_code err_code;
  auto pipe1 = factory1.create(&err_code);
  ASSERT_FALSE(err_code);
  // Same factory: instances share the bound name.
  auto pipe2 = factory1.create(&err_code);
  ASSERT_FALSE(err_code);
  EXPECT_FALSE(pipe1->connected());

  // Another server binding the name fails while any of those instances exists.
  EXPECT_FALSE(factory2.create(&err_code));
  EXPECT_EQ(err_code, boost::asio::error::address_in_use);
  pipe1.reset();
  EXPECT_FALSE(factory2.create(&err_code));
  EXPECT_EQ(err_code, boost::asio::error::address_in_use);

  pipe2.reset();
  auto pipe3 = factory2.create(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(pipe3);
}

TEST(Local_server_pipe_test, Address_in_use_surfaces_from_start)
{
  Test_logger logger;
  const Temp_dir lock_dir;
  const auto name = unique_pipe_name("inuse");

  // Someone outside any listener (say, another kind of server) has the name.
  Local_server_pipe_factory squatter(&logger, name, Access_descriptor::unrestricted());
  const auto squatting = squatter.create();

  Pipe_listener::Options opts;
  opts.m_lock_dir = lock_dir.path();
  Pipe_listener lsn(&logger, name, opts);
  Error_code err_code;
  lsn.start(&err_code);
  EXPECT_EQ(err_code, boost::asio::error::address_in_use);
  EXPECT_FALSE(lsn.started());
}

TEST(Local_server_pipe_test, Wait_cancelled)
{
  Test_logger logger;
  Local_server_pipe_factory factory(&logger, unique_pipe_name("cancel"), Access_descriptor::unrestricted());
  auto pipe = factory.create();

  util::Cancel_signal cancel;
  boost::thread canceler([&]()
  {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
    cancel.cancel();
  });
  Error_code err_code;
  pipe->wait_for_connection(cancel, &err_code);
  EXPECT_EQ(err_code, boost::asio::error::operation_aborted);
  EXPECT_FALSE(pipe->connected());
  canceler.join();
}

} // namespace npipe::transport::test
