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

#include "npipe/common.hpp"

/**
 * Namespace containing the npipe::transport module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * npipe::transport might report are system errors and would not draw from this set of codes/messages but rather
 * from `boost::asio::error` or `boost::system::errc` (possibly others).  Mixing the two is normal with
 * boost.system.
 */
namespace npipe::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by npipe::transport functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::connection_reset`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message(), identical to
 * (or as close as possible to) the `///` comment below; and its symbol, minus `S_`, to Category::code_symbol().
 * Add new values at the end, ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// User called an API with 1 or more arguments against the API contract.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// A blocking operation was intentionally interrupted or preemptively canceled.
  S_INTERRUPTED,

  /// Async completion handler is being called prematurely, because underlying object is shutting down, as user desires.
  S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER,

  /// Listener start requested, but the listener has already been started.
  S_LISTENER_ALREADY_STARTED,

  /// Listener operation requested, but the listener has been stopped.
  S_LISTENER_STOPPED,

  /// Listener could not be created: another listener (in this or another process) already serves that endpoint.
  S_ENDPOINT_IN_USE_BY_OTHER_LISTENER,

  /**
   * Exclusivity guard: boost.interprocess emitted miscellaneous library exception sans a system code; a WARNING
   * message at throw-time should contain all possible details.
   */
  S_EXCLUSIVITY_GUARD_BIPC_MISC_LIBRARY_ERROR,

  /// Server pipe could not be created: the access descriptor does not specify a valid permissions level.
  S_INVALID_ACCESS_DESCRIPTOR,

  /// Server pipe could not be obtained: the server pipe pool has been disposed.
  S_SERVER_PIPE_POOL_DISPOSED,

  /// Listener loop could not publish an accepted connection: the accept queue was unexpectedly closed.
  S_ACCEPT_QUEUE_CLOSED_UNEXPECTEDLY,

  /// Listener loop gave up: too many consecutive transient faults waiting for connections.
  S_TRANSIENT_FAULT_LIMIT_EXCEEDED,

  /// Connection operation requested, but the connection has been closed.
  S_CONNECTION_CLOSED,

  /// Listener loop gave up: an exception not carrying an error code was thrown while accepting.
  S_LISTENER_UNEXPECTED_EXCEPTION,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.  It glues the (completely general)
 * #Error_code to the npipe::transport-specific error code set, so that one can implicitly covert from the latter
 * to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Accepts the `int` value or the
 * case-insensitive symbol sans `S_` (e.g., "INTERRUPTED").  If none is recognized, Code::S_END_SENTINEL is the
 * result.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream, e.g., Code::S_INTERRUPTED => `"INTERRUPTED"`.
 * The output string is compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace npipe::transport::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system allows `enum` `Code` to be converted to `Error_code`.
 * This is the official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::npipe::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
