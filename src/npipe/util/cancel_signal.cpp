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
#include "npipe/util/cancel_signal.hpp"

namespace npipe::util
{

// Static initializers.

const Cancel_signal::Callback_id Cancel_signal::S_NO_CALLBACK = 0;

// Cancel_signal implementations.

Cancel_signal::Cancel_signal() :
  m_cancelled(false),
  m_next_id(S_NO_CALLBACK + 1),
  m_running_id(S_NO_CALLBACK)
{
  // That's it.
}

bool Cancel_signal::cancel()
{
  Lock_guard lock(m_mutex);
  if (m_cancelled)
  {
    return false;
  }
  // else
  m_cancelled = true;
  m_running_thread_id = boost::this_thread::get_id();

  /* Run them one at a time, unlocked while each runs.  A callback still in m_callbacks can be forget()-ten
   * meanwhile and will then not run; one being run makes forget() wait for m_callback_done_condvar. */
  while (!m_callbacks.empty())
  {
    const auto it = m_callbacks.begin();
    m_running_id = it->first;
    auto func = std::move(it->second);
    m_callbacks.erase(it);

    lock.unlock();
    func();
    lock.lock();

    m_running_id = S_NO_CALLBACK;
    m_callback_done_condvar.notify_all();
  }

  return true;
} // Cancel_signal::cancel()

bool Cancel_signal::cancelled() const
{
  Lock_guard lock(m_mutex);
  return m_cancelled;
}

Cancel_signal::Callback_id Cancel_signal::on_cancel(Task&& func) const
{
  {
    Lock_guard lock(m_mutex);
    if (!m_cancelled)
    {
      const auto id = m_next_id++;
      m_callbacks.emplace(id, std::move(func));
      return id;
    }
  } // Lock_guard lock(m_mutex);

  func(); // Too late to register: the cancel() has happened.  Outside lock, as for cancel()-executed callbacks.
  return S_NO_CALLBACK;
}

void Cancel_signal::forget(Callback_id id) const
{
  if (id == S_NO_CALLBACK)
  {
    return;
  }
  // else

  Lock_guard lock(m_mutex);
  if (m_callbacks.erase(id) != 0)
  {
    return; // Never ran; never will.
  }
  // else: It already ran; or it is running right now.

  if (boost::this_thread::get_id() == m_running_thread_id)
  {
    return; // Forgetting from within a callback (or from cancel()'s own thread): it's not concurrent with us.
  }
  // else
  while (m_running_id == id)
  {
    m_callback_done_condvar.wait(lock);
  }
} // Cancel_signal::forget()

std::ostream& operator<<(std::ostream& os, const Cancel_signal& val)
{
  return os << "cancel_sig[" << (val.cancelled() ? "cancelled" : "armed") << "]@" << static_cast<const void*>(&val);
}

// Cancel_registration implementations.

Cancel_registration::Cancel_registration(const Cancel_signal& signal, Task&& func) :
  m_signal(signal),
  m_id(m_signal.on_cancel(std::move(func)))
{
  // That's it.
}

Cancel_registration::~Cancel_registration()
{
  m_signal.forget(m_id);
}

} // namespace npipe::util
