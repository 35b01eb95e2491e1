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

#pragma once

#include <flow/log/log.hpp>

namespace npipe::test
{

/**
 * Process-wide test settings, set up by the test `main()` from its command line.
 */
struct Test_config
{
  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static Test_config& get_singleton()
  {
    static Test_config s_config;
    return s_config;
  }

  /// Lowest severity that Test_logger lets through by default.
  flow::log::Sev m_sev = flow::log::Sev::S_WARNING;
}; // struct Test_config

} // namespace npipe::test
