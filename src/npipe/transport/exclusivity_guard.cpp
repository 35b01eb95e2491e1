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
#include "npipe/transport/exclusivity_guard.hpp"
#include "npipe/transport/error.hpp"
#include "npipe/util/detail/util.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <set>

namespace npipe::transport
{

namespace
{

/// Lock files held by Exclusivity_guard objects in this process, protected by held_lock_files_mutex().
std::set<std::string>& held_lock_files()
{
  static std::set<std::string> s_files;
  return s_files;
}

/// See held_lock_files().
flow::util::Mutex_non_recursive& held_lock_files_mutex()
{
  static flow::util::Mutex_non_recursive s_mutex;
  return s_mutex;
}

} // namespace (anon)

// Exclusivity_guard implementations.

Exclusivity_guard::Exclusivity_guard(flow::log::Logger* logger_ptr, const util::Shared_name& absolute_name,
                                     const fs::path& lock_dir, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_absolute_name(absolute_name),
  m_lock_file_path(lock_dir / ("npipe_" + absolute_name.str() + ".lock")),
  m_held(false)
{
  using util::op_with_possible_bipc_exception;
  using util::shared_resource_permissions;
  using util::Permissions_level;
  using flow::error::Runtime_error;
  using flow::util::Lock_guard;
  using flow::util::Mutex_non_recursive;
  using boost::system::system_category;

  Error_code sys_err_code;

  {
    Lock_guard<Mutex_non_recursive> lock(held_lock_files_mutex());
    if (held_lock_files().count(m_lock_file_path.string()) != 0)
    {
      FLOW_LOG_WARNING("Exclusivity guard [" << *this << "]: Already held within this process.");
      sys_err_code = error::Code::S_ENDPOINT_IN_USE_BY_OTHER_LISTENER;
    }
    else
    {
      // Create the file if needed (bipc::file_lock requires it to exist).  Anyone may lock it; permissions say so.
      const auto fd = ::open(m_lock_file_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC,
                             shared_resource_permissions(Permissions_level::S_UNRESTRICTED).get_permissions());
      if (fd == -1)
      {
        sys_err_code = Error_code(errno, system_category());
        FLOW_LOG_WARNING("Exclusivity guard [" << *this << "]: Could not open/create lock file; details logged "
                         "below.");
        FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      }
      else
      {
        ::close(fd);

        bool locked = false;
        op_with_possible_bipc_exception(get_logger(), &sys_err_code,
                                        error::Code::S_EXCLUSIVITY_GUARD_BIPC_MISC_LIBRARY_ERROR,
                                        "Exclusivity_guard::Exclusivity_guard()", [&]()
        {
          bipc::file_lock file_lock(m_lock_file_path.c_str());
          locked = file_lock.try_lock();
          if (locked)
          {
            m_lock.swap(file_lock);
          }
        });

        if ((!sys_err_code) && (!locked))
        {
          FLOW_LOG_WARNING("Exclusivity guard [" << *this << "]: Held by another process.");
          sys_err_code = error::Code::S_ENDPOINT_IN_USE_BY_OTHER_LISTENER;
        }
        else if (!sys_err_code)
        {
          held_lock_files().insert(m_lock_file_path.string());
          m_held = true;
        }
      } // else if (fd != -1)
    } // else if (!held in this process)
  } // Lock_guard lock(held_lock_files_mutex());

  if (sys_err_code)
  {
    if (err_code)
    {
      *err_code = sys_err_code;
      return;
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_INFO("Exclusivity guard [" << *this << "]: Acquired.");
} // Exclusivity_guard::Exclusivity_guard()

Exclusivity_guard::~Exclusivity_guard()
{
  release();
}

bool Exclusivity_guard::release()
{
  using util::op_with_possible_bipc_exception;
  using flow::util::Lock_guard;
  using flow::util::Mutex_non_recursive;

  if (!m_held)
  {
    return false;
  }
  // else

  Error_code sys_err_code;
  op_with_possible_bipc_exception(get_logger(), &sys_err_code,
                                  error::Code::S_EXCLUSIVITY_GUARD_BIPC_MISC_LIBRARY_ERROR,
                                  "Exclusivity_guard::release()", [&]()
  {
    m_lock.unlock();
  });
  if (sys_err_code)
  {
    // It logged.  The lock goes away with the file handle below regardless.
    FLOW_LOG_WARNING("Exclusivity guard [" << *this << "]: Unlock reported error (see above); proceeding.");
  }

  bipc::file_lock().swap(m_lock); // Close the handle.
  m_held = false;
  {
    Lock_guard<Mutex_non_recursive> lock(held_lock_files_mutex());
    held_lock_files().erase(m_lock_file_path.string());
  }

  FLOW_LOG_INFO("Exclusivity guard [" << *this << "]: Released.");
  return true;
} // Exclusivity_guard::release()

bool Exclusivity_guard::held() const
{
  return m_held;
}

const fs::path& Exclusivity_guard::lock_file_path() const
{
  return m_lock_file_path;
}

const util::Shared_name& Exclusivity_guard::absolute_name() const
{
  return m_absolute_name;
}

std::ostream& operator<<(std::ostream& os, const Exclusivity_guard& val)
{
  return os << "excl_guard[" << val.absolute_name() << " @ " << val.lock_file_path()
            << (val.held() ? " HELD" : "") << "]@" << static_cast<const void*>(&val);
}

} // namespace npipe::transport
