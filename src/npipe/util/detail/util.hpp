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
#include "npipe/util/detail/util_fwd.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/interprocess/exceptions.hpp>

namespace npipe::util
{

// Template implementations.

template<typename Func>
void op_with_possible_bipc_exception(flow::log::Logger* logger_ptr, Error_code* err_code,
                                     const Error_code& misc_bipc_lib_error,
                                     String_view context,
                                     const Func& func)
{
  using bipc::interprocess_exception;
  using boost::system::system_category;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { op_with_possible_bipc_exception(logger_ptr, actual_err_code, misc_bipc_lib_error, context, func); },
         err_code, context))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  try
  {
    func();
  }
  catch (const interprocess_exception& exc)
  {
    /* bipc reports either a native (errno) code, which maps cleanly onto system_category(), or one of its
     * own error_code_t values with no system equivalent.  Log everything; emit the best code we can. */
    const auto native_code_raw = exc.get_native_error();
    const auto bipc_err_code_enum = exc.get_error_code();
    FLOW_LOG_WARNING("bipc threw interprocess_exception; will emit some hopefully suitable npipe Error_code; "
                     "but here are all the details of the original exception: native code int "
                     "[" << native_code_raw << "]; bipc error_code_t enum->int "
                     "[" << int(bipc_err_code_enum) << "]; message = [" << exc.what() << "]; "
                     "context = [" << context << "].");
    if (native_code_raw != 0)
    {
      const auto& sys_err_code = *err_code = Error_code(native_code_raw, system_category());
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      return;
    }
    // else

    *err_code = misc_bipc_lib_error; // The earlier WARNING is good enough.
    return;
  }
  // Got here: all good.
  err_code->clear();
} // op_with_possible_bipc_exception()

} // namespace npipe::util
