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

#include "npipe/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/util/util.hpp>
#include <atomic>

namespace npipe::test
{

std::string get_test_suite_name()
{
  const auto test_info = ::testing::UnitTest::GetInstance()->current_test_info();
  return test_info ? std::string(test_info->test_suite_name()) : std::string();
}

const npipe::util::Process_credentials& get_process_creds()
{
  static const auto S_PROCESS_CREDS = npipe::util::Process_credentials::own_process_credentials();
  return S_PROCESS_CREDS;
}

npipe::util::Shared_name unique_pipe_name(const std::string& prefix)
{
  using npipe::util::Shared_name;
  using flow::util::ostream_op_string;

  static std::atomic<unsigned int> s_idx(0);
  auto name = Shared_name::ct(ostream_op_string("npipeTest_", prefix, '_', get_process_creds().process_id(),
                                                '_', ++s_idx));
  name.sanitize();
  return name;
}

Temp_dir::Temp_dir() :
  m_path(fs::temp_directory_path() / fs::unique_path("npipe_test_%%%%-%%%%-%%%%"))
{
  fs::create_directories(m_path);
}

Temp_dir::~Temp_dir()
{
  boost::system::error_code dummy; // Best-effort cleanup.
  fs::remove_all(m_path, dummy);
}

const fs::path& Temp_dir::path() const
{
  return m_path;
}

} // namespace npipe::test
