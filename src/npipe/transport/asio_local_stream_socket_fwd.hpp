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
#include "npipe/util/util_fwd.hpp"
#include "npipe/util/native_handle.hpp"
#include <flow/log/log.hpp>
#include <boost/asio.hpp>

/**
 * Additional (versus boost.asio) APIs for advanced work with local stream (Unix domain) sockets.  On Linux
 * these are what a named pipe is made of: a listening socket bound in the abstract namespace at the pipe's
 * util::Shared_name, and one peer socket per connected client.
 */
namespace npipe::transport::asio_local_stream_socket
{

// Types.

/// Short-hand for boost.asio Unix domain socket namespace.  In particular `connect_pair()` free function lives here.
namespace local_ns = boost::asio::local;

/// Short-hand for boost.asio Unix domain stream-socket protocol.
using Protocol = local_ns::stream_protocol;

/// Short-hand for boost.asio Unix domain stream-socket acceptor (listening guy) socket.
using Acceptor = Protocol::acceptor;

/// Short-hand for boost.asio Unix domain peer stream-socket (usually-connected-or-empty guy).
using Peer_socket = Protocol::socket;

/// Short-hand for boost.asio Unix domain peer stream-socket endpoint.
using Endpoint = Protocol::endpoint;

class Opt_peer_process_credentials;

} // namespace npipe::transport::asio_local_stream_socket
