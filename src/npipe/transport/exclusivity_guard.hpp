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
#pragma once

#include "npipe/transport/transport_fwd.hpp"
#include "npipe/util/shared_name.hpp"
#include <flow/log/log.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/noncopyable.hpp>

namespace npipe::transport
{

// Types.

/**
 * Machine-wide mutual-exclusion token for a pipe name: at most one Exclusivity_guard per name exists at a time,
 * across all processes (of users that can open the lock file) and within this process.  Pipe_listener holds one for
 * its lifetime, so that a second listener on the same name fails fast with
 * error::Code::S_ENDPOINT_IN_USE_BY_OTHER_LISTENER instead of fighting over connections.
 *
 * Implementation: an advisory `bipc::file_lock` on `<lock dir>/npipe_<name>.lock` (created if needed, never
 * removed).  Advisory file locks are per-process, so a process-wide registry of held lock files supplements it.
 *
 * Not thread-safe for concurrent calls on one object.
 */
class Exclusivity_guard :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Acquires the token or fails.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param absolute_name
   *        The pipe name.
   * @param lock_dir
   *        Directory of the lock file.  Must exist.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ENDPOINT_IN_USE_BY_OTHER_LISTENER (already held, here or elsewhere),
   *        error::Code::S_EXCLUSIVITY_GUARD_BIPC_MISC_LIBRARY_ERROR, system codes (e.g., lock file not creatable).
   *        On error held() is `false`.
   */
  explicit Exclusivity_guard(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                             const fs::path& lock_dir, Error_code* err_code = 0);

  /// Equivalent to release().
  ~Exclusivity_guard();

  // Methods.

  /**
   * Gives up the token, if held.
   * @return `true` if it was held (and is now released); `false` if not held (never acquired, or released already).
   */
  bool release();

  /**
   * Whether the token is held.
   * @return See above.
   */
  bool held() const;

  /**
   * The lock file.
   * @return See above.
   */
  const fs::path& lock_file_path() const;

  /**
   * The pipe name.
   * @return See above.
   */
  const util::Shared_name& absolute_name() const;

private:
  // Data.

  /// See absolute_name().
  const util::Shared_name m_absolute_name;

  /// See lock_file_path().
  const fs::path m_lock_file_path;

  /// The advisory lock; default-cted (no file) unless acquired.
  bipc::file_lock m_lock;

  /// See held().
  bool m_held;
}; // class Exclusivity_guard

} // namespace npipe::transport
