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

#include "npipe/transport/accept_queue.hpp"
#include "npipe/transport/error.hpp"
#include "npipe/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <boost/chrono.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/move/make_unique.hpp>

namespace npipe::transport::test
{

namespace
{
using Int_ptr = boost::movelib::unique_ptr<int>;
using Queue = Accept_queue<Int_ptr>;
} // namespace (anon)

TEST(Accept_queue_test, Capacity_one_fifo)
{
  npipe::test::Test_logger logger;
  Queue queue(&logger, "q");

  auto item = boost::movelib::make_unique<int>(1);
  EXPECT_TRUE(queue.try_write(&item));
  EXPECT_FALSE(item);

  auto item2 = boost::movelib::make_unique<int>(2);
  EXPECT_FALSE(queue.try_write(&item2)); // Full.
  ASSERT_TRUE(item2); // Untouched on failure.
  EXPECT_EQ(queue.size(), 1u);

  Int_ptr out;
  EXPECT_TRUE(queue.try_read(&out));
  EXPECT_EQ(*out, 1);
  EXPECT_FALSE(queue.try_read(&out));
  EXPECT_EQ(*out, 1);
}

TEST(Accept_queue_test, Blocked_writer_proceeds_after_read)
{
  npipe::test::Test_logger logger;
  Queue queue(&logger, "q");
  const util::Cancel_signal never;

  auto first = boost::movelib::make_unique<int>(1);
  ASSERT_TRUE(queue.try_write(&first));

  boost::thread writer([&]()
  {
    auto second = boost::movelib::make_unique<int>(2);
    while (!queue.try_write(&second))
    {
      Error_code err_code;
      ASSERT_TRUE(queue.wait_to_write(never, &err_code));
      ASSERT_FALSE(err_code);
    }
  });

  Int_ptr out;
  ASSERT_TRUE(queue.wait_to_read(never));
  ASSERT_TRUE(queue.try_read(&out));
  EXPECT_EQ(*out, 1);

  Error_code err_code;
  while (!queue.try_read(&out))
  {
    ASSERT_TRUE(queue.wait_to_read(never, &err_code));
  }
  EXPECT_EQ(*out, 2);
  writer.join();
}

TEST(Accept_queue_test, Graceful_completion_drains_then_ends)
{
  npipe::test::Test_logger logger;
  Queue queue(&logger, "q");
  const util::Cancel_signal never;

  auto item = boost::movelib::make_unique<int>(7);
  ASSERT_TRUE(queue.try_write(&item));
  EXPECT_TRUE(queue.complete());
  EXPECT_FALSE(queue.complete()); // First wins.
  EXPECT_TRUE(queue.completed());

  auto late = boost::movelib::make_unique<int>(8);
  EXPECT_FALSE(queue.try_write(&late));
  Error_code err_code;
  EXPECT_FALSE(queue.wait_to_write(never, &err_code));
  EXPECT_FALSE(err_code);

  // Left-over item still readable.
  ASSERT_TRUE(queue.wait_to_read(never, &err_code));
  Int_ptr out;
  ASSERT_TRUE(queue.try_read(&out));
  EXPECT_EQ(*out, 7);

  EXPECT_FALSE(queue.wait_to_read(never, &err_code));
  EXPECT_FALSE(err_code);
}

TEST(Accept_queue_test, Faulted_completion_reaches_all_readers)
{
  npipe::test::Test_logger logger;
  Queue queue(&logger, "q");
  const util::Cancel_signal never;
  const Error_code FAULT = boost::asio::error::access_denied;

  Error_code err1;
  Error_code err2;
  boost::thread reader1([&]() { EXPECT_FALSE(queue.wait_to_read(never, &err1)); });
  boost::thread reader2([&]() { EXPECT_FALSE(queue.wait_to_read(never, &err2)); });
  boost::this_thread::sleep_for(boost::chrono::milliseconds(50));

  EXPECT_TRUE(queue.complete(FAULT));
  EXPECT_FALSE(queue.complete()); // Cause not overwritten.
  reader1.join();
  reader2.join();
  EXPECT_EQ(err1, FAULT);
  EXPECT_EQ(err2, FAULT);
  EXPECT_EQ(queue.completion_cause(), FAULT);

  Error_code err3;
  EXPECT_FALSE(queue.wait_to_read(never, &err3));
  EXPECT_EQ(err3, FAULT);
  EXPECT_THROW(queue.wait_to_read(never), flow::error::Runtime_error);
}

TEST(Accept_queue_test, Cancellation_interrupts_waits)
{
  npipe::test::Test_logger logger;
  Queue queue(&logger, "q");

  util::Cancel_signal cancel;
  Error_code read_err;
  boost::thread reader([&]() { EXPECT_FALSE(queue.wait_to_read(cancel, &read_err)); });
  boost::this_thread::sleep_for(boost::chrono::milliseconds(50));
  cancel.cancel();
  reader.join();
  EXPECT_EQ(read_err, error::Code::S_INTERRUPTED);
  EXPECT_FALSE(queue.completed()); // Queue unaffected.

  auto item = boost::movelib::make_unique<int>(1);
  ASSERT_TRUE(queue.try_write(&item));
  Error_code write_err;
  EXPECT_FALSE(queue.wait_to_write(cancel, &write_err)); // Already cancelled: returns at once.
  EXPECT_EQ(write_err, error::Code::S_INTERRUPTED);

  // An item beats cancellation for readers.
  Error_code err_code;
  EXPECT_TRUE(queue.wait_to_read(cancel, &err_code));
  EXPECT_FALSE(err_code);
}

} // namespace npipe::transport::test
