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
#include "npipe/transport/error.hpp"
#include "npipe/util/util_fwd.hpp"

namespace npipe::transport::error
{

// Types.

/**
 * The boost.system category for errors returned by the npipe::transport module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * This class's declaration is not available outside this translation unit; its logic is accessed indirectly
 * through standard boost.system machinery (`Error_code::category().name()`, `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_INTERRUPTED => `"INTERRUPTED"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "npipe/transport";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments against the API contract.";
  case Code::S_INTERRUPTED:
    return "A blocking operation was intentionally interrupted or preemptively canceled.";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "Async completion handler is being called prematurely, because underlying object is shutting down, "
           "as user desires.";
  case Code::S_LISTENER_ALREADY_STARTED:
    return "Listener start requested, but the listener has already been started.";
  case Code::S_LISTENER_STOPPED:
    return "Listener operation requested, but the listener has been stopped.";
  case Code::S_ENDPOINT_IN_USE_BY_OTHER_LISTENER:
    return "Listener could not be created: another listener (in this or another process) already serves that "
           "endpoint.";
  case Code::S_EXCLUSIVITY_GUARD_BIPC_MISC_LIBRARY_ERROR:
    return "Exclusivity guard: boost.interprocess emitted miscellaneous library exception sans a system code; "
           "a WARNING message at throw-time should contain all possible details.";
  case Code::S_INVALID_ACCESS_DESCRIPTOR:
    return "Server pipe could not be created: the access descriptor does not specify a valid permissions level.";
  case Code::S_SERVER_PIPE_POOL_DISPOSED:
    return "Server pipe could not be obtained: the server pipe pool has been disposed.";
  case Code::S_ACCEPT_QUEUE_CLOSED_UNEXPECTEDLY:
    return "Listener loop could not publish an accepted connection: the accept queue was unexpectedly closed.";
  case Code::S_TRANSIENT_FAULT_LIMIT_EXCEEDED:
    return "Listener loop gave up: too many consecutive transient faults waiting for connections.";
  case Code::S_CONNECTION_CLOSED:
    return "Connection operation requested, but the connection has been closed.";
  case Code::S_LISTENER_UNEXPECTED_EXCEPTION:
    return "Listener loop gave up: an exception not carrying an error code was thrown while accepting.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_INTERRUPTED:
    return "INTERRUPTED";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER";
  case Code::S_LISTENER_ALREADY_STARTED:
    return "LISTENER_ALREADY_STARTED";
  case Code::S_LISTENER_STOPPED:
    return "LISTENER_STOPPED";
  case Code::S_ENDPOINT_IN_USE_BY_OTHER_LISTENER:
    return "ENDPOINT_IN_USE_BY_OTHER_LISTENER";
  case Code::S_EXCLUSIVITY_GUARD_BIPC_MISC_LIBRARY_ERROR:
    return "EXCLUSIVITY_GUARD_BIPC_MISC_LIBRARY_ERROR";
  case Code::S_INVALID_ACCESS_DESCRIPTOR:
    return "INVALID_ACCESS_DESCRIPTOR";
  case Code::S_SERVER_PIPE_POOL_DISPOSED:
    return "SERVER_PIPE_POOL_DISPOSED";
  case Code::S_ACCEPT_QUEUE_CLOSED_UNEXPECTEDLY:
    return "ACCEPT_QUEUE_CLOSED_UNEXPECTEDLY";
  case Code::S_TRANSIENT_FAULT_LIMIT_EXCEEDED:
    return "TRANSIENT_FAULT_LIMIT_EXCEEDED";
  case Code::S_CONNECTION_CLOSED:
    return "CONNECTION_CLOSED";
  case Code::S_LISTENER_UNEXPECTED_EXCEPTION:
    return "LISTENER_UNEXPECTED_EXCEPTION";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace npipe::transport::error
