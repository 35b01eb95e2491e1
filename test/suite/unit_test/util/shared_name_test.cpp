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

#include "npipe/util/shared_name.hpp"
#include <gtest/gtest.h>
#include <flow/util/util.hpp>
#include <string>

namespace npipe::util::test
{

TEST(Shared_name_test, Sanitize_collapses_separators)
{
  auto name = Shared_name::ct("/app//listener_/_x1");
  EXPECT_FALSE(name.sanitized());
  EXPECT_TRUE(name.sanitize());
  EXPECT_EQ(name.str(), "_app_listener_x1");
  EXPECT_TRUE(name.sanitized());
}

TEST(Shared_name_test, Sanitize_failure_leaves_name_unchanged)
{
  const std::string RAW = "app/bad-char";
  auto name = Shared_name::ct(RAW);
  EXPECT_FALSE(name.sanitize());
  EXPECT_EQ(name.str(), RAW);

  auto long_name = Shared_name::ct(std::string(Shared_name::S_MAX_LENGTH + 1, 'a'));
  EXPECT_FALSE(long_name.sanitized());
  EXPECT_FALSE(long_name.sanitize());
  EXPECT_EQ(long_name.size(), Shared_name::S_MAX_LENGTH + 1);

  auto max_name = Shared_name::ct(std::string(Shared_name::S_MAX_LENGTH, 'a'));
  EXPECT_TRUE(max_name.sanitized());
}

TEST(Shared_name_test, Composition_and_comparison)
{
  const auto base = Shared_name::ct("app");
  const auto full = base / "svc" + "1";
  EXPECT_EQ(full.str(), "app_svc1");
  EXPECT_EQ(full, Shared_name::ct("app_svc1"));
  EXPECT_NE(full, base);
  EXPECT_TRUE(base < full);

  auto appended = base;
  appended /= Shared_name::ct("x");
  EXPECT_EQ(appended.str(), "app_x");

  EXPECT_TRUE(Shared_name::S_EMPTY.empty());
  EXPECT_EQ(flow::util::ostream_op_string(Shared_name::S_EMPTY), "null");
  EXPECT_EQ(flow::util::ostream_op_string(base), "3|app");
}

} // namespace npipe::util::test
