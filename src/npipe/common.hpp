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

/* flow/common.hpp #undef-s a couple of things that would otherwise clash; so get it in before our own stuff.
 * flow/util/util.hpp pulls it in. */
#include <flow/util/util.hpp>

#include "npipe/detail/common.hpp"
#include <boost/interprocess/interprocess_fwd.hpp>
#include <boost/filesystem.hpp>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any npipe/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the npipe project: a named-pipe server connection listener.
 *
 * The outward-facing piece is npipe::transport::Pipe_listener.  It owns a pool of not-yet-connected server pipe
 * instances (transport::Server_pipe), runs N listener loops that wait for clients on those instances, and hands
 * each connected client to the user as a transport::Pipe_connection via a capacity-1 hand-off queue.
 * npipe::util holds the generally useful odds and ends (names, native handles, cancellation, object pooling).
 */
namespace npipe
{

// Types.  They're outside of `namespace ::npipe::util` for brevity due to their frequent use.

/// Short-hand for boost.interprocess namespace.
namespace bipc = boost::interprocess;

/// Short-hand for filesystem namespace.
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef NPIPE_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration comprising various log components used by npipe's own
 * internal logging.  The real definition is generated in npipe/detail/common.hpp from
 * npipe/detail/macros/log_component_enum_declare.macros.hpp.
 */
enum class Log_component
{
  /// Placeholder for Doxygen; see above.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in npipe::Log_component to its
 * string representation as used in log output and verbosity config.  npipe logging uses this for the names
 * of its various log components.  Pass it to `flow::log::Config::init_component_names()`.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_NPIPE_LOG_COMPONENT_NAME_MAP;

#endif // NPIPE_DOXYGEN_ONLY

} // namespace npipe
