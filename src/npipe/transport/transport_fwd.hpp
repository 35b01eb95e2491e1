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
#include <boost/move/unique_ptr.hpp>
#include <boost/shared_ptr.hpp>

/**
 * npipe::transport contains the named-pipe listener and its parts: server pipe instances and their pool,
 * the listener loops, the accept queue, the exclusivity guard, and the per-connection byte-stream adapter.
 *
 * The user-facing class is Pipe_listener: construct it (with a name and Pipe_listener::Options), start() it,
 * accept() connections (each a Pipe_connection), stop() it.
 */
namespace npipe::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Access_descriptor;
class Server_pipe;
class Local_server_pipe;
class Local_server_pipe_factory;
class Server_pipe_pool_policy;
template<typename Item>
class Accept_queue;
struct Stream_buffer_config;
struct Connection_buffer_config;
class Pipe_connection;
class Exclusivity_guard;
class Pipe_listener;

/// Short-hand for the owning holder of a server pipe instance.
using Server_pipe_ptr = boost::movelib::unique_ptr<Server_pipe>;

/// The server pipe instance pool: util::Object_pool specialized by Server_pipe_pool_policy.
using Server_pipe_pool = util::Object_pool<Server_pipe, Server_pipe_pool_policy>;

/// Short-hand for the owning holder of an accepted connection, as emitted by Pipe_listener::accept().
using Pipe_connection_ptr = boost::movelib::unique_ptr<Pipe_connection>;

/**
 * Function that creates a not-yet-connected server pipe instance, or emits an error.  `err_code` is never null.
 * Pipe_listener uses Local_server_pipe_factory by default; a custom one can be supplied (e.g., in tests).
 */
using Server_pipe_factory = Function<Server_pipe_ptr (Error_code* err_code)>;

/// Function to which a closed Pipe_connection gives back its (disconnected) server pipe instance.
using Server_pipe_returner = Function<void (Server_pipe_ptr&& pipe)>;

// Free functions.

/**
 * Prints string representation of the given `Access_descriptor` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Access_descriptor& val);

/**
 * Returns `true` if and only if all the fields of the two descriptors are equal.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Access_descriptor& val1, const Access_descriptor& val2);

/**
 * Returns `!(val1 == val2)`.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Access_descriptor& val1, const Access_descriptor& val2);

/**
 * Prints string representation of the given `Server_pipe` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Server_pipe& val);

/**
 * Prints string representation of the given `Stream_buffer_config` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Stream_buffer_config& val);

/**
 * Prints string representation of the given `Pipe_connection` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pipe_connection& val);

/**
 * Prints string representation of the given `Exclusivity_guard` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Exclusivity_guard& val);

/**
 * Prints string representation of the given `Pipe_listener` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pipe_listener& val);

} // namespace npipe::transport
