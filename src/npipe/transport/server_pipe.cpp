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
#include "npipe/transport/server_pipe.hpp"

namespace npipe::transport
{

// Server_pipe implementations.

Server_pipe::~Server_pipe() = default;

std::ostream& operator<<(std::ostream& os, const Server_pipe& val)
{
  return os << "srv_pipe[" << val.nickname() << (val.connected() ? " CONNECTED" : "") << "]@"
            << static_cast<const void*>(&val);
}

// Server_pipe_pool_policy implementations.

Server_pipe_pool_policy::Server_pipe_pool_policy(Server_pipe_factory&& factory) :
  m_factory(std::move(factory))
{
  assert(m_factory);
}

Server_pipe_ptr Server_pipe_pool_policy::create(Error_code* err_code)
{
  assert(err_code);
  return m_factory(err_code);
}

bool Server_pipe_pool_policy::should_return(const Server_pipe& pipe) // Static.
{
  return !pipe.connected();
}

} // namespace npipe::transport
