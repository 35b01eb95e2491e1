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

#include <npipe/transport/pipe_listener.hpp>
#include <npipe/transport/detail/asio_local_stream_socket_fwd.hpp>
#include <npipe/util/util_fwd.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <boost/thread/future.hpp>
#include <unistd.h>
#include <algorithm>
#include <cstdlib>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  It listens on a name, connects one client to it, echoes one message, and stops.
 * Not so much for correctness testing but to see it build successfully and run without barfing. */
int main(int argc, char const * const * argv)
{
  using npipe::util::Shared_name;
  using npipe::util::Blob_const;
  using npipe::util::Blob_mutable;
  using npipe::transport::Pipe_listener;
  using npipe::transport::asio_local_stream_socket::Peer_socket;
  using npipe::transport::asio_local_stream_socket::endpoint_at_shared_name;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;
  using flow::Flow_log_component;
  using flow::util::ostream_op_string;

  using std::string;
  using std::exception;

  const string LOG_FILE = "npipe_link_test.log";
  const int BAD_EXIT = 1;

  // Set up logging within this function.  Flow stuff gives us time stamps and such for free.
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the npipe/Flow logging will go into this file.
  // Usage: npipe_link_test [<pipe name> [<listener parallelism>]].
  const string name_str((argc >= 2) ? string(argv[1]) : ostream_op_string("npipeLinkTest_", ::getpid()));
  const size_t n_loops = (argc >= 3) ? size_t(std::max(1, std::atoi(argv[2]))) : 1;
  FLOW_LOG_INFO("Opening log file [" << LOG_FILE << "] for npipe/Flow logs only.");
  Config log_config = std_log_config;
  log_config.init_component_to_union_idx_mapping<npipe::Log_component>(1, 999);
  log_config.init_component_names<npipe::Log_component>(npipe::S_NPIPE_LOG_COMPONENT_NAME_MAP, false, "npipe-");
  log_config.configure_default_verbosity(Sev::S_DATA, true); // High-verbosity.  Use S_INFO in production.
  Async_file_logger log_logger(nullptr, &log_config, LOG_FILE, false /* No rotation; we're no serious business. */);

  try
  {
    auto name = Shared_name::ct(name_str);
    if (!name.sanitize())
    {
      FLOW_LOG_WARNING("Pipe name [" << name_str << "] is not usable.");
      return BAD_EXIT;
    }

    Pipe_listener::Options opts;
    opts.m_listener_parallelism = n_loops;
    opts.m_restrict_to_current_user = true;
    opts.m_lock_dir = npipe::fs::temp_directory_path(); // Not /var/run: we may not be root.

    Pipe_listener lsn(&log_logger, name, opts);
    lsn.start();
    FLOW_LOG_INFO("Listening on [" << name << "] with [" << n_loops << "] loops.");

    boost::asio::io_context io;
    Peer_socket client(io);
    client.connect(endpoint_at_shared_name(&log_logger, name));

    auto conn = lsn.accept();
    FLOW_LOG_INFO("Accepted [" << *conn << "] from [" << conn->remote_peer_process_credentials() << "].");

    const string PAYLOAD = "Hello, world!";
    boost::asio::write(client, boost::asio::buffer(PAYLOAD));

    // Echo back whatever arrives, once.
    string rcvd(PAYLOAD.size(), '\0');
    boost::promise<size_t> echoed;
    conn->async_read_some(Blob_mutable(&rcvd[0], rcvd.size()), [&](const Error_code& err_code, size_t n_rcvd)
    {
      if (err_code)
      {
        FLOW_LOG_WARNING("Problem receiving; unexpected!  Error: [" << err_code << "] [" << err_code.message() << "].");
        echoed.set_value(0);
        return;
      }
      // else
      conn->async_write(Blob_const(&rcvd[0], n_rcvd), [&, n_rcvd](const Error_code& write_err_code)
      {
        echoed.set_value(write_err_code ? 0 : n_rcvd);
      });
    });
    const size_t n_echoed = echoed.get_future().get();

    string back(n_echoed, '\0');
    boost::asio::read(client, boost::asio::buffer(&back[0], back.size()));
    FLOW_LOG_INFO("Client got echo: [" << back << "].");

    conn.reset();
    lsn.stop();
    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
