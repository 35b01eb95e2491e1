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

#include "npipe/util/util_fwd.hpp"
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/thread.hpp>
#include <boost/noncopyable.hpp>
#include <map>

namespace npipe::util
{

// Types.

/**
 * A one-shot, thread-safe cancellation signal, on which blocking operations can register interest.
 *
 * The signal starts non-cancelled.  cancel() flips it, exactly once: the first call returns `true` and synchronously
 * runs every registered callback; any later call is a no-op returning `false`.  There is no reset.
 *
 * A blocking operation (e.g., transport::Server_pipe::wait_for_connection(), transport::Accept_queue::wait_to_read())
 * takes `const Cancel_signal&`: it can observe and register on the signal but cannot itself trigger it.
 * It registers a callback via on_cancel() that wakes whatever it is blocked on, and unregisters
 * via forget() (or more conveniently a Cancel_registration) before returning.  After forget() returns, the callback
 * is guaranteed not to be executing, nor will it ever execute; so it may safely refer to the blocking operation's
 * stack.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.  A callback must not call cancel() on the same signal;
 * it may call forget() on its own registration (no-op).
 */
class Cancel_signal :
  private boost::noncopyable
{
public:
  // Types.

  /// Identifies a registered callback; see on_cancel().
  using Callback_id = uint64_t;

  // Constants.

  /// on_cancel() returns this if the signal was already cancelled (callback ran synchronously; nothing to forget).
  static const Callback_id S_NO_CALLBACK;

  // Constructors/destructor.

  /// Constructs non-cancelled signal with no callbacks registered.
  Cancel_signal();

  // Methods.

  /**
   * Triggers the signal, if not already triggered, running all registered callbacks synchronously before returning.
   *
   * @return `true` if this call triggered the signal; `false` if it had already been triggered.
   */
  bool cancel();

  /**
   * Whether cancel() has been called.
   * @return See above.
   */
  bool cancelled() const;

  /**
   * Registers `func` to execute upon cancel().  If already cancelled, executes `func` synchronously right now
   * and returns #S_NO_CALLBACK.
   *
   * @param func
   *        Callback.  It executes from the thread calling cancel() (or this thread, as noted).
   * @return ID to pass to forget().
   */
  Callback_id on_cancel(Task&& func) const;

  /**
   * Undoes on_cancel(): after this returns, the callback is not running and will never run.  If the callback is
   * being executed concurrently by cancel() in another thread, blocks until it finishes.
   *
   * @param id
   *        Value returned by on_cancel().  #S_NO_CALLBACK is allowed (no-op).
   */
  void forget(Callback_id id) const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type; it must be compatible with #m_callbacks_done_condvar.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Data.

  /// Protects all below data.
  mutable Mutex m_mutex;

  /// Whether cancel() has been called.
  bool m_cancelled;

  /// The next ID to issue from on_cancel().
  mutable Callback_id m_next_id;

  /// The registered, not yet executed, callbacks.  Emptied at cancel().
  mutable std::map<Callback_id, Task> m_callbacks;

  /// While cancel() executes callbacks: the ID of the one executing; else #S_NO_CALLBACK.
  Callback_id m_running_id;

  /// While cancel() executes callbacks: the ID of the thread doing so.
  boost::thread::id m_running_thread_id;

  /// Signaled each time a callback finishes executing within cancel().
  mutable boost::condition_variable m_callback_done_condvar;
}; // class Cancel_signal

/**
 * RAII wrapper around Cancel_signal::on_cancel() and Cancel_signal::forget(): registers in ctor; forgets in dtor.
 */
class Cancel_registration :
  private boost::noncopyable
{
public:
  /**
   * Registers `func` on `signal`.
   *
   * @param signal
   *        The signal.  It must outlive `*this`.
   * @param func
   *        See Cancel_signal::on_cancel().
   */
  explicit Cancel_registration(const Cancel_signal& signal, Task&& func);

  /// Unregisters; see Cancel_signal::forget().
  ~Cancel_registration();

private:
  /// See ctor.
  const Cancel_signal& m_signal;

  /// Result of `m_signal.on_cancel()`.
  const Cancel_signal::Callback_id m_id;
}; // class Cancel_registration

} // namespace npipe::util
