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

#include "npipe/test/test_config.hpp"
#include <gtest/gtest.h>
#include <flow/log/log.hpp>
#include <iostream>
#include <sstream>
#include <string>

/* Runs all npipe unit tests.  Besides the usual gtest flags, understands:
 *   --min-log-level=<sev>: lowest log severity shown, e.g., "info" or "trace"; default "warning". */
int main(int argc, char** argv)
{
  using npipe::test::Test_config;
  using flow::log::Sev;
  using std::string;

  const string SEV_FLAG = "--min-log-level=";

  ::testing::InitGoogleTest(&argc, argv); // Removes the gtest flags.

  for (int idx = 1; idx < argc; ++idx)
  {
    const string arg(argv[idx]);
    if (arg.compare(0, SEV_FLAG.size(), SEV_FLAG) == 0)
    {
      std::istringstream is(arg.substr(SEV_FLAG.size()));
      Sev sev;
      is >> sev;
      if (!is)
      {
        std::cerr << "Bad log severity in [" << arg << "].\n";
        return 1;
      }
      // else
      Test_config::get_singleton().m_sev = sev;
    }
    else
    {
      std::cerr << "Unknown argument [" << arg << "].\n";
      return 1;
    }
  }

  return RUN_ALL_TESTS();
}
