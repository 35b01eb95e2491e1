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
#include "npipe/transport/detail/asio_local_stream_socket_fwd.hpp"
#include "npipe/transport/asio_local_stream_socket.hpp"
#include "npipe/util/shared_name.hpp"
#include <flow/error/error.hpp>

namespace npipe::transport::asio_local_stream_socket
{

// Implementations.

Endpoint endpoint_at_shared_name(flow::log::Logger* logger_ptr,
                                 const util::Shared_name& absolute_name, Error_code* err_code)
{
  namespace bind_ns = flow::util::bind_ns;
  using boost::system::system_error;
  using std::string;

  FLOW_ERROR_EXEC_FUNC_AND_THROW_ON_ERROR(Endpoint, endpoint_at_shared_name,
                                          logger_ptr, bind_ns::cref(absolute_name), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  /* Linux abstract namespace: sun_path[0] is NUL; the rest (up to the given address length) is the name.
   * boost.asio's endpoint::path(string_view-ish) overload copies the full length including embedded NULs and
   * sets the address length accordingly; the `const char*` overload would stop at the first NUL. */
  string abstract_namespace_name(size_t(1), '\0');
  abstract_namespace_name += absolute_name.str();
  FLOW_LOG_TRACE("Abstract-namespace (Linux extension) name consists of 1 NUL + the name "
                 "[" << absolute_name << "]; total of [" << abstract_namespace_name.size() << "] bytes.");

  Endpoint endpoint;
  auto& sys_err_code = *err_code;
  try
  {
    endpoint.path(abstract_namespace_name); // Throws on error (too-long name).
    sys_err_code.clear();
  }
  catch (const system_error& exc)
  {
    FLOW_LOG_WARNING("Unable to set up native local stream endpoint structure; "
                     "could be due to name length; details logged below.");
    sys_err_code = exc.code();
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    return Endpoint();
  }

  return endpoint;
} // endpoint_at_shared_name()

// Opt_peer_process_credentials implementations.

Opt_peer_process_credentials::Opt_peer_process_credentials() = default;
Opt_peer_process_credentials::Opt_peer_process_credentials(const Opt_peer_process_credentials&) = default;
Opt_peer_process_credentials& Opt_peer_process_credentials::operator=(const Opt_peer_process_credentials&) = default;

} // namespace npipe::transport::asio_local_stream_socket
