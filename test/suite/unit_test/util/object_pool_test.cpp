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

#include "npipe/util/object_pool.hpp"
#include "npipe/transport/server_pipe.hpp"
#include "npipe/transport/error.hpp"
#include "npipe/test/fake_server_pipe.hpp"
#include "npipe/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>

namespace npipe::util::test
{

namespace
{

struct Widget
{
  explicit Widget(int id) : m_id(id), m_dirty(false) {}
  int m_id;
  bool m_dirty;
};

class Widget_policy
{
public:
  explicit Widget_policy(int* n_created) : m_n_created(n_created) {}

  boost::movelib::unique_ptr<Widget> create(Error_code* err_code)
  {
    if (m_fail)
    {
      *err_code = boost::asio::error::no_memory;
      return boost::movelib::unique_ptr<Widget>();
    }
    err_code->clear();
    return boost::movelib::unique_ptr<Widget>(new Widget(++(*m_n_created)));
  }

  bool should_return(const Widget& widget) const
  {
    return !widget.m_dirty;
  }

  bool m_fail = false;

private:
  int* m_n_created;
};

using Widget_pool = Object_pool<Widget, Widget_policy>;

const Error_code DISPOSED_ERR = transport::error::Code::S_SERVER_PIPE_POOL_DISPOSED;

} // namespace (anon)

TEST(Object_pool_test, Reuses_returned_objects_lifo)
{
  npipe::test::Test_logger logger;
  int n_created = 0;
  Widget_pool pool(&logger, "widgets", Widget_policy(&n_created), 4, DISPOSED_ERR);

  auto w1 = pool.acquire();
  auto w2 = pool.acquire();
  EXPECT_EQ(n_created, 2);
  const auto w2_addr = w2.get();

  EXPECT_TRUE(pool.release(std::move(w1)));
  EXPECT_TRUE(pool.release(std::move(w2)));
  EXPECT_EQ(pool.cached_count(), 2u);

  auto w3 = pool.acquire();
  EXPECT_EQ(w3.get(), w2_addr);
  EXPECT_EQ(n_created, 2);
  EXPECT_EQ(pool.cached_count(), 1u);
}

TEST(Object_pool_test, Ineligible_or_excess_objects_are_destroyed)
{
  npipe::test::Test_logger logger;
  int n_created = 0;
  Widget_pool pool(&logger, "widgets", Widget_policy(&n_created), 1, DISPOSED_ERR);

  auto dirty = pool.acquire();
  dirty->m_dirty = true;
  EXPECT_FALSE(pool.release(std::move(dirty)));
  EXPECT_FALSE(dirty);
  EXPECT_EQ(pool.cached_count(), 0u);

  auto a = pool.acquire();
  auto b = pool.acquire();
  EXPECT_TRUE(pool.release(std::move(a)));
  EXPECT_FALSE(pool.release(std::move(b))); // At capacity.
  EXPECT_EQ(pool.cached_count(), 1u);

  EXPECT_FALSE(pool.release(boost::movelib::unique_ptr<Widget>()));
}

TEST(Object_pool_test, Creation_failure_is_reported)
{
  npipe::test::Test_logger logger;
  int n_created = 0;
  Widget_policy policy(&n_created);
  policy.m_fail = true;
  Widget_pool pool(&logger, "widgets", std::move(policy), 1, DISPOSED_ERR);

  Error_code err_code;
  EXPECT_FALSE(pool.acquire(&err_code));
  EXPECT_EQ(err_code, boost::asio::error::no_memory);

  EXPECT_THROW(pool.acquire(), flow::error::Runtime_error);
}

TEST(Object_pool_test, Dispose_is_idempotent_and_final)
{
  npipe::test::Test_logger logger;
  int n_created = 0;
  Widget_pool pool(&logger, "widgets", Widget_policy(&n_created), 4, DISPOSED_ERR);

  auto w = pool.acquire();
  auto cached = pool.acquire();
  pool.release(std::move(cached));
  EXPECT_EQ(pool.cached_count(), 1u);

  pool.dispose();
  EXPECT_TRUE(pool.disposed());
  EXPECT_EQ(pool.cached_count(), 0u);
  pool.dispose();
  EXPECT_TRUE(pool.disposed());

  Error_code err_code;
  EXPECT_FALSE(pool.acquire(&err_code));
  EXPECT_EQ(err_code, DISPOSED_ERR);
  EXPECT_FALSE(pool.release(std::move(w))); // Destroyed, not cached.
  EXPECT_EQ(pool.cached_count(), 0u);
}

TEST(Object_pool_test, Server_pipe_policy_rejects_connected_pipes)
{
  using transport::Server_pipe_pool;
  using transport::Server_pipe_pool_policy;
  using npipe::test::Fake_pipe_script;

  npipe::test::Test_logger logger;
  const auto script = boost::make_shared<Fake_pipe_script>();
  Server_pipe_pool pool(&logger, "pipes", Server_pipe_pool_policy(script->factory()), 4, DISPOSED_ERR);

  auto pipe = pool.acquire();
  EXPECT_TRUE(Server_pipe_pool_policy::should_return(*pipe));

  script->push_connect();
  const Cancel_signal never;
  pipe->wait_for_connection(never);
  ASSERT_TRUE(pipe->connected());
  EXPECT_FALSE(Server_pipe_pool_policy::should_return(*pipe));

  EXPECT_FALSE(pool.release(std::move(pipe))); // Never reuse a connected instance.
  EXPECT_EQ(script->n_destroyed(), 1u);

  auto pipe2 = pool.acquire();
  script->push_connect();
  pipe2->wait_for_connection(never);
  pipe2->disconnect();
  EXPECT_TRUE(pool.release(std::move(pipe2))); // Disconnected: reusable.
  EXPECT_EQ(pool.cached_count(), 1u);
  EXPECT_EQ(script->n_created(), 2u);
}

} // namespace npipe::util::test
