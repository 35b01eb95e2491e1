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
#include "npipe/transport/error.hpp"
#include "npipe/util/cancel_signal.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <flow/error/error.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>
#include <deque>

namespace npipe::transport
{

// Types.

/**
 * Bounded multi-producer/multi-consumer hand-off queue with a terminal *completion*: the channel through which
 * listener loops hand accepted connections to Pipe_listener::accept() callers.
 *
 * Writers block (wait_to_write()) while the queue is full; readers block (wait_to_read()) while it is empty.
 * complete() closes the queue for writing, optionally recording a cause (the listener's fatal error); the first
 * complete() wins.  Items already in the queue at completion remain readable; once the queue is both completed and
 * empty, readers get end-of-stream, plus the cause if any.  Both blocking calls return early, with
 * error::Code::S_INTERRUPTED, if their Cancel_signal is triggered.
 *
 * A write that fails (full, closed, interrupted) leaves its item untouched: the caller still owns it.
 *
 * @tparam Item
 *         Movable item type; e.g., #Pipe_connection_ptr.
 */
template<typename Item>
class Accept_queue :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs empty, open queue.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        For logging.
   * @param capacity
   *        Max items held at once.  Must be at least 1.
   */
  explicit Accept_queue(flow::log::Logger* logger_ptr, util::String_view nickname_str, size_t capacity = 1);

  // Methods.

  /**
   * Non-blocking write.
   *
   * @param item
   *        Moved-from on success only.
   * @return `true` if enqueued; `false` if full or completed.
   */
  bool try_write(Item* item);

  /**
   * Blocks until there is space to write, the queue is completed, or `cancel` is triggered.
   * Note that another writer may take the space before a subsequent try_write().
   *
   * @param cancel
   *        Interrupts the wait.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INTERRUPTED.
   * @return `true` if space is available; `false` if completed (with no error) or on error.
   */
  bool wait_to_write(const util::Cancel_signal& cancel, Error_code* err_code = 0);

  /**
   * Non-blocking read.
   *
   * @param item
   *        Receives the oldest item on success; untouched otherwise.
   * @return `true` if an item was dequeued.
   */
  bool try_read(Item* item);

  /**
   * Blocks until an item is available to read, the queue is completed and empty, or `cancel` is triggered.
   *
   * @param cancel
   *        Interrupts the wait.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INTERRUPTED; the completion cause, if completed with one and empty.
   * @return `true` if an item is available; `false` if end-of-stream or on error.
   */
  bool wait_to_read(const util::Cancel_signal& cancel, Error_code* err_code = 0);

  /**
   * Closes the queue for writing and wakes all waiters.  Only the first call has effect.
   *
   * @param cause
   *        Falsy for a graceful close; else the error readers shall see after draining.
   * @return `true` if this was the first call.
   */
  bool complete(const Error_code& cause = Error_code());

  /**
   * Whether complete() has been called.
   * @return See above.
   */
  bool completed() const;

  /**
   * The `cause` given to the effective complete(); falsy if none or not completed.
   * @return See above.
   */
  Error_code completion_cause() const;

  /**
   * Items currently enqueued.
   * @return See above.
   */
  size_t size() const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type; it must be compatible with #m_changed_condvar.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Data.

  /// For logging.
  const std::string m_nickname;

  /// See ctor.
  const size_t m_capacity;

  /// Protects the below.
  mutable Mutex m_mutex;

  /// Signaled on any change of interest to waiters: read, write, completion, cancellation.
  boost::condition_variable m_changed_condvar;

  /// The items, oldest first.
  std::deque<Item> m_items;

  /// See completed().
  bool m_completed;

  /// See completion_cause().
  Error_code m_completion_cause;
}; // class Accept_queue

// Template implementations.

template<typename Item>
Accept_queue<Item>::Accept_queue(flow::log::Logger* logger_ptr, util::String_view nickname_str, size_t capacity) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_capacity(capacity),
  m_completed(false)
{
  assert(m_capacity >= 1);
}

template<typename Item>
bool Accept_queue<Item>::try_write(Item* item)
{
  {
    Lock_guard lock(m_mutex);
    if (m_completed || (m_items.size() >= m_capacity))
    {
      return false;
    }
    // else
    m_items.emplace_back(std::move(*item));
  }
  m_changed_condvar.notify_all();
  return true;
}

template<typename Item>
bool Accept_queue<Item>::wait_to_write(const util::Cancel_signal& cancel, Error_code* err_code)
{
  {
    bool result;
    if (flow::error::exec_and_throw_on_error
          ([&](Error_code* actual_err_code) -> bool { return wait_to_write(cancel, actual_err_code); },
           &result, err_code, "Accept_queue::wait_to_write()"))
    {
      return result;
    }
  }
  // else
  err_code->clear();

  // Registered before locking: if already cancelled, the callback runs synchronously and locks m_mutex.
  util::Cancel_registration cancel_reg(cancel, [&]()
  {
    {
      Lock_guard lock(m_mutex);
    } // So no waiter misses the notification between its check of cancelled() and its wait().
    m_changed_condvar.notify_all();
  });

  Lock_guard lock(m_mutex);
  while (true)
  {
    if (m_completed)
    {
      return false;
    }
    if (m_items.size() < m_capacity)
    {
      return true;
    }
    if (cancel.cancelled())
    {
      FLOW_LOG_TRACE("Accept_queue [" << m_nickname << "]: Write-wait interrupted.");
      *err_code = error::Code::S_INTERRUPTED;
      return false;
    }
    // else
    m_changed_condvar.wait(lock);
  }
} // Accept_queue::wait_to_write()

template<typename Item>
bool Accept_queue<Item>::try_read(Item* item)
{
  {
    Lock_guard lock(m_mutex);
    if (m_items.empty())
    {
      return false;
    }
    // else
    *item = std::move(m_items.front());
    m_items.pop_front();
  }
  m_changed_condvar.notify_all();
  return true;
}

template<typename Item>
bool Accept_queue<Item>::wait_to_read(const util::Cancel_signal& cancel, Error_code* err_code)
{
  {
    bool result;
    if (flow::error::exec_and_throw_on_error
          ([&](Error_code* actual_err_code) -> bool { return wait_to_read(cancel, actual_err_code); },
           &result, err_code, "Accept_queue::wait_to_read()"))
    {
      return result;
    }
  }
  // else
  err_code->clear();

  util::Cancel_registration cancel_reg(cancel, [&]()
  {
    {
      Lock_guard lock(m_mutex);
    }
    m_changed_condvar.notify_all();
  });

  Lock_guard lock(m_mutex);
  while (true)
  {
    if (!m_items.empty())
    {
      return true;
    }
    if (m_completed)
    {
      *err_code = m_completion_cause;
      return false;
    }
    if (cancel.cancelled())
    {
      FLOW_LOG_TRACE("Accept_queue [" << m_nickname << "]: Read-wait interrupted.");
      *err_code = error::Code::S_INTERRUPTED;
      return false;
    }
    // else
    m_changed_condvar.wait(lock);
  }
} // Accept_queue::wait_to_read()

template<typename Item>
bool Accept_queue<Item>::complete(const Error_code& cause)
{
  {
    Lock_guard lock(m_mutex);
    if (m_completed)
    {
      return false;
    }
    // else
    m_completed = true;
    m_completion_cause = cause;
  }

  if (cause)
  {
    FLOW_LOG_INFO("Accept_queue [" << m_nickname << "]: Completed with cause [" << cause << "] "
                  "[" << cause.message() << "].");
  }
  else
  {
    FLOW_LOG_TRACE("Accept_queue [" << m_nickname << "]: Completed gracefully.");
  }
  m_changed_condvar.notify_all();
  return true;
}

template<typename Item>
bool Accept_queue<Item>::completed() const
{
  Lock_guard lock(m_mutex);
  return m_completed;
}

template<typename Item>
Error_code Accept_queue<Item>::completion_cause() const
{
  Lock_guard lock(m_mutex);
  return m_completion_cause;
}

template<typename Item>
size_t Accept_queue<Item>::size() const
{
  Lock_guard lock(m_mutex);
  return m_items.size();
}

} // namespace npipe::transport
