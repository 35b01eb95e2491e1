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
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <vector>

namespace npipe::util
{

// Types.

/**
 * A bounded, thread-safe cache of reusable `Obj`s, with creation and return-eligibility decided by a `Policy`.
 *
 * acquire() hands out a cached object if there is one, else a freshly created one (`Policy::create()`).
 * release() takes an object back: it is cached for a future acquire() if and only if
 * `Policy::should_return()` says so, the cache is not at capacity, and the pool has not been dispose()d;
 * otherwise it is simply destroyed.  After dispose(), the cache is empty (objects destroyed), acquire() fails with
 * the error code given at construction, and release() destroys whatever it is given.  dispose() is idempotent.
 *
 * Objects are destroyed outside the internal lock.
 *
 * ### `Policy` concept ###
 *   - `Ptr create(Error_code* err_code)`: Creates a new object or emits an error (and returns null).
 *     `err_code` is non-null.
 *   - `bool should_return(const Obj&) const`: The reuse predicate.
 *   - Move-constructible.
 *
 * @tparam Obj
 *         Pooled type; may be abstract.
 * @tparam Policy
 *         See above.
 */
template<typename Obj, typename Policy>
class Object_pool :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the pooled object holder.
  using Ptr = boost::movelib::unique_ptr<Obj>;

  // Constructors/destructor.

  /**
   * Constructs an empty, usable pool.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param policy
   *        See class doc header.
   * @param capacity
   *        Max number of cached objects.  0 means none are ever cached (every release() destroys).
   * @param disposed_err_code
   *        What acquire() emits after dispose().
   */
  explicit Object_pool(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                       Policy&& policy, size_t capacity, const Error_code& disposed_err_code);

  /// Destroys cached objects (equivalent to dispose()).
  ~Object_pool();

  // Methods.

  /**
   * Returns a cached object, if any, else a new one from `Policy::create()`.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        the `disposed_err_code` from ctor (if dispose() was called); whatever `Policy::create()` emits.
   * @return Non-null on success; null on error.
   */
  Ptr acquire(Error_code* err_code = 0);

  /**
   * Gives back an object previously acquire()d (or created elsewhere; that's OK too).  See class doc header.
   *
   * @param obj
   *        The object.  Becomes null.  If it is null, no-op.
   * @return `true` if cached; `false` if destroyed.
   */
  bool release(Ptr&& obj);

  /// Destroys all cached objects and makes acquire() fail from now on.  Idempotent.
  void dispose();

  /**
   * Whether dispose() has been called.
   * @return See above.
   */
  bool disposed() const;

  /**
   * Number of objects currently cached.
   * @return See above.
   */
  size_t cached_count() const;

  /**
   * Nickname as passed to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  Policy m_policy;

  /// See ctor.
  const size_t m_capacity;

  /// See ctor.
  const Error_code m_disposed_err_code;

  /// Protects #m_cache and #m_disposed.
  mutable Mutex m_mutex;

  /// The cache: LIFO.
  std::vector<Ptr> m_cache;

  /// See disposed().
  bool m_disposed;
}; // class Object_pool

// Template implementations.

template<typename Obj, typename Policy>
Object_pool<Obj, Policy>::Object_pool(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                      Policy&& policy, size_t capacity, const Error_code& disposed_err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_UTIL),
  m_nickname(nickname_str),
  m_policy(std::move(policy)),
  m_capacity(capacity),
  m_disposed_err_code(disposed_err_code),
  m_disposed(false)
{
  m_cache.reserve(m_capacity);
  FLOW_LOG_TRACE("Object_pool [" << m_nickname << "]: Created with capacity [" << m_capacity << "].");
}

template<typename Obj, typename Policy>
Object_pool<Obj, Policy>::~Object_pool()
{
  dispose();
}

template<typename Obj, typename Policy>
typename Object_pool<Obj, Policy>::Ptr Object_pool<Obj, Policy>::acquire(Error_code* err_code)
{
  {
    Ptr result;
    if (flow::error::exec_and_throw_on_error
          ([&](Error_code* actual_err_code) -> Ptr { return acquire(actual_err_code); },
           &result, err_code, "Object_pool::acquire()"))
    {
      return result;
    }
  }
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  {
    Lock_guard lock(m_mutex);
    if (m_disposed)
    {
      FLOW_LOG_TRACE("Object_pool [" << m_nickname << "]: acquire() after dispose(); refusing.");
      *err_code = m_disposed_err_code;
      return Ptr();
    }
    // else
    if (!m_cache.empty())
    {
      Ptr obj(std::move(m_cache.back()));
      m_cache.pop_back();
      FLOW_LOG_TRACE("Object_pool [" << m_nickname << "]: Reusing cached object; "
                     "[" << m_cache.size() << "] remain cached.");
      err_code->clear();
      return obj;
    }
  } // Lock_guard lock(m_mutex);

  /* Create outside the lock: creation may be a sys-call or two, and concurrent acquire()s shouldn't serialize
   * on it.  A dispose() racing with this is fine: the caller gets an object it will eventually release(), at
   * which point it's destroyed. */
  FLOW_LOG_TRACE("Object_pool [" << m_nickname << "]: Cache empty; creating new object.");
  auto obj = m_policy.create(err_code);
  assert((!obj) == bool(*err_code));
  if (*err_code)
  {
    FLOW_LOG_WARNING("Object_pool [" << m_nickname << "]: Creating new object failed; "
                     "code [" << *err_code << "] [" << err_code->message() << "].");
  }
  return obj;
} // Object_pool::acquire()

template<typename Obj, typename Policy>
bool Object_pool<Obj, Policy>::release(Ptr&& obj_moved)
{
  Ptr obj(std::move(obj_moved));
  if (!obj)
  {
    return false;
  }
  // else

  {
    Lock_guard lock(m_mutex);
    if ((!m_disposed) && (m_cache.size() < m_capacity) && m_policy.should_return(*obj))
    {
      m_cache.emplace_back(std::move(obj));
      FLOW_LOG_TRACE("Object_pool [" << m_nickname << "]: Returned object cached; "
                     "[" << m_cache.size() << "] now cached.");
      return true;
    }
    // else
    FLOW_LOG_TRACE("Object_pool [" << m_nickname << "]: Returned object not eligible for caching "
                   "(disposed [" << m_disposed << "], cached [" << m_cache.size() << '/' << m_capacity << "]); "
                   "destroying it.");
  } // Lock_guard lock(m_mutex);

  obj.reset(); // Outside the lock.
  return false;
} // Object_pool::release()

template<typename Obj, typename Policy>
void Object_pool<Obj, Policy>::dispose()
{
  std::vector<Ptr> doomed;
  {
    Lock_guard lock(m_mutex);
    if (m_disposed)
    {
      return;
    }
    // else
    m_disposed = true;
    doomed.swap(m_cache);
  }

  FLOW_LOG_INFO("Object_pool [" << m_nickname << "]: Disposing; destroying [" << doomed.size() << "] "
                "cached objects.  Further acquisitions will fail.");
  doomed.clear();
}

template<typename Obj, typename Policy>
bool Object_pool<Obj, Policy>::disposed() const
{
  Lock_guard lock(m_mutex);
  return m_disposed;
}

template<typename Obj, typename Policy>
size_t Object_pool<Obj, Policy>::cached_count() const
{
  Lock_guard lock(m_mutex);
  return m_cache.size();
}

template<typename Obj, typename Policy>
const std::string& Object_pool<Obj, Policy>::nickname() const
{
  return m_nickname;
}

} // namespace npipe::util
