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

#include "npipe/transport/detail/listener_loop.hpp"
#include "npipe/transport/error.hpp"
#include "npipe/test/fake_server_pipe.hpp"
#include "npipe/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>

namespace npipe::transport::detail::test
{

namespace
{

using npipe::test::Fake_pipe_script;
using npipe::test::Test_logger;
using Queue = Listener_loop::Queue;

} // namespace (anon)

TEST(Listener_loop_test, Transient_faults)
{
  EXPECT_TRUE(Listener_loop::transient_fault(boost::asio::error::connection_aborted));
  EXPECT_TRUE(Listener_loop::transient_fault(boost::asio::error::connection_reset));
  EXPECT_TRUE(Listener_loop::transient_fault(boost::asio::error::broken_pipe));
  EXPECT_FALSE(Listener_loop::transient_fault(boost::asio::error::operation_aborted));
  EXPECT_FALSE(Listener_loop::transient_fault(boost::asio::error::access_denied));
  EXPECT_FALSE(Listener_loop::transient_fault(error::Code::S_INTERRUPTED));
}

TEST(Listener_loop_test, Wait_done_without_thread)
{
  Test_logger logger;
  const auto script = boost::make_shared<Fake_pipe_script>();
  const auto pool = boost::make_shared<Server_pipe_pool>(&logger, "pool", Server_pipe_pool_policy(script->factory()),
                                                         1, Error_code(error::Code::S_SERVER_PIPE_POOL_DISPOSED));
  const auto queue = boost::make_shared<Queue>(&logger, "queue");
  const util::Cancel_signal cancel;

  // A loop whose thread never started (never start()ed, or start() threw) has nothing to wait for.
  Listener_loop loop(&logger, "loop", pool, queue, cancel, { Stream_buffer_config::unbounded(),
                                                             Stream_buffer_config::unbounded() }, 0);
  loop.wait_done();
  EXPECT_EQ(loop.nickname(), "loop");
  EXPECT_FALSE(queue->completed());
}

TEST(Listener_loop_test, Exception_completes_queue_with_fault)
{
  Test_logger logger;
  const auto script = boost::make_shared<Fake_pipe_script>();
  const auto pool = boost::make_shared<Server_pipe_pool>(&logger, "pool", Server_pipe_pool_policy(script->factory()),
                                                         1, Error_code(error::Code::S_SERVER_PIPE_POOL_DISPOSED));
  const auto queue = boost::make_shared<Queue>(&logger, "queue");
  util::Cancel_signal cancel;

  Listener_loop loop(&logger, "loop", pool, queue, cancel, { Stream_buffer_config::unbounded(),
                                                             Stream_buffer_config::unbounded() }, 0);
  loop.start(pool->acquire());

  script->set_create_exception("boom");
  script->push_fault(boost::asio::error::connection_reset); // Recovery needs a new pipe: that throws.
  loop.wait_done();

  EXPECT_TRUE(queue->completed());
  EXPECT_EQ(queue->completion_cause(), error::Code::S_LISTENER_UNEXPECTED_EXCEPTION);
  EXPECT_EQ(script->n_destroyed(), script->n_created());
  cancel.cancel();
}

} // namespace npipe::transport::detail::test
