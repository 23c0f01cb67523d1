/* glproxy: Remote Command Proxy
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "glproxy/owner/frame_coordinator.hpp"
#include "glproxy/requester/requester.hpp"
#include "glproxy/transport/socket_link.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <atomic>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We use the compiled pieces end to end (owner coordinator, requester, socket links,
 * capnp codec) plus a template thing or two; not so much for correctness testing but to see it build
 * successfully and run without barfing. */
int main()
{
  using glproxy::owner::Frame_coordinator;
  using glproxy::owner::Coordinator_config;
  using glproxy::owner::Operation_table;
  using glproxy::requester::Requester;
  using glproxy::transport::Socket_link;
  using glproxy::transport::value_cast;
  using glproxy::Log_component;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;

  const string LOG_FILE = "glproxy_link_test.log";
  const int BAD_EXIT = 1;
  const int64_t TEST_VAL = 42;
  const size_t N_FRAMES = 5;

  // Console logging for this function; the library logs into the file below.
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");
  std_log_config.init_component_to_union_idx_mapping<Log_component>(2000, 999);
  std_log_config.init_component_names<Log_component>(glproxy::S_GLPROXY_LOG_COMPONENT_NAME_MAP,
                                                     false, "glproxy-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  FLOW_LOG_INFO("Opening log file [" << LOG_FILE << "] for glproxy/Flow logs only.");
  Config log_config = std_log_config;
  log_config.configure_default_verbosity(Sev::S_INFO, true);
  Async_file_logger log_logger(nullptr, &log_config, LOG_FILE, false /* No rotation; we're no serious business. */);

  try
  {
    // The resource: one counter.  Touched only in the owner thread.
    int64_t counter = 0;
    Operation_table operations;
    operations.add_typed<void, int64_t>("add", [&](int64_t delta) { counter += delta; });
    operations.add_typed<int64_t>("get", [&]() { return counter; });
    operations.add_constant("ANSWER", glproxy::transport::to_value(TEST_VAL));

    size_t n_presents = 0;
    Coordinator_config config;
    config.m_n_warm_up_frames = 1;
    Frame_coordinator coordinator(&log_logger, operations, [&]() { ++n_presents; }, config);

    auto links = Socket_link::connect_pair(&log_logger, "link_test");

    Requester requester(&log_logger, 1, std::move(links.second));
    std::atomic<size_t> n_frames_seen(0);
    requester.start([]() {},
                    [&](uint64_t)
    {
      ++n_frames_seen;
      const auto err_code = requester.stub("add").post(1);
      if (err_code)
      {
        FLOW_LOG_WARNING("Could not post [add]: [" << err_code << "] [" << err_code.message() << "].");
      }
    },
                    [&](const Error_code& err_code)
    {
      FLOW_LOG_WARNING("Requester link error [" << err_code << "] [" << err_code.message() << "].");
    });

    coordinator.add_requester(1, std::move(links.first)); // Throws on error.

    const auto faults = coordinator.run_frames(N_FRAMES);
    if (!faults.empty())
    {
      FLOW_LOG_WARNING("[" << faults.size() << "] requesters faulted.");
      return BAD_EXIT;
    }

    // Outside any frame the owner executes requests on arrival; so this may be awaited.
    auto completion = requester.stub("get")();
    const auto result = value_cast<int64_t>(completion.get());
    const auto answer = value_cast<int64_t>(requester.constant("ANSWER"));

    FLOW_LOG_INFO("Counter [" << result << "] after [" << n_frames_seen.load() << "] requester frames and "
                  "[" << n_presents << "] presents; constant [" << answer << "].");

    if ((result != int64_t(N_FRAMES + config.m_n_warm_up_frames)) || (n_presents != N_FRAMES)
        || (answer != TEST_VAL))
    {
      FLOW_LOG_WARNING("Unexpected results.");
      return BAD_EXIT;
    }

    FLOW_LOG_INFO("Looks good.  Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
