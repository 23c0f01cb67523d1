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
#include "test_common.hpp"
#include "glproxy/owner/command_proxy.hpp"
#include <gtest/gtest.h>

namespace glproxy::owner::test
{

using glproxy::test::test_logger;
using glproxy::test::make_request;
using glproxy::test::Test_resource;
using transport::Envelope;
using transport::Request;
using transport::Batch;
using transport::Reply;
using transport::Release;
using transport::Frame_begin;
using transport::Frame_end;
using transport::Bootstrap;
using transport::Handle_ref;
using transport::Value;
using transport::to_value;

namespace
{

const transport::requester_id_t S_ID = 1;

/// A proxy over a Test_resource; everything it sends lands in #m_sent.
class Command_proxy_test :
  public ::testing::Test
{
protected:
  Command_proxy_test() :
    m_proxy(test_logger(), S_ID, m_resource.operations(),
            [this](const Envelope& msg, Error_code* err_code)
    {
      if (m_send_err)
      {
        *err_code = m_send_err;
        return;
      }
      m_sent.push_back(msg);
      err_code->clear();
    })
  {
    // Nothing else.
  }

  /// Replies sent so far, in order.
  std::vector<Reply> replies() const
  {
    std::vector<Reply> result;
    for (const auto& msg : m_sent)
    {
      if (const auto reply = std::get_if<Reply>(&msg.m_body))
      {
        result.push_back(*reply);
      }
    }
    return result;
  }

  void dispatch(Request&& req)
  {
    m_proxy.dispatch(Envelope{ S_ID, std::move(req) });
  }

  /// Runs a frame as Frame_coordinator would: begin, the given requests, frame end, flush.
  void run_frame(std::vector<Request>&& reqs)
  {
    auto future = m_proxy.begin_frame_collection();
    ASSERT_TRUE(future.valid());
    for (auto& req : reqs)
    {
      dispatch(std::move(req));
    }
    EXPECT_FALSE(future.is_ready());
    m_proxy.dispatch(Envelope{ S_ID, Frame_end() });
    EXPECT_TRUE(future.is_ready());
    m_proxy.flush();
  }

  Test_resource m_resource;
  std::vector<Envelope> m_sent;
  Error_code m_send_err;
  Command_proxy m_proxy;
}; // class Command_proxy_test

} // namespace (anonymous)

TEST_F(Command_proxy_test, Bootstrap)
{
  m_proxy.send_bootstrap();
  ASSERT_EQ(m_sent.size(), 1u);
  EXPECT_EQ(m_sent[0].m_requester_id, S_ID);
  const auto& bootstrap = std::get<Bootstrap>(m_sent[0].m_body);
  EXPECT_EQ(bootstrap.m_operation_names, m_resource.operations().names());
  EXPECT_EQ(bootstrap.m_constants.at("MAX_TEXTURE_SIZE"), to_value(4096));
}

TEST_F(Command_proxy_test, Executes_at_once_outside_frame)
{
  dispatch(make_request(1, "useProgram", { to_value(3) }));
  dispatch(make_request(2, "currentProgram", {}, true));

  EXPECT_EQ(m_resource.m_program, 3);
  const auto reps = replies();
  ASSERT_EQ(reps.size(), 1u); // Only the one that wanted it.
  EXPECT_EQ(reps[0].m_request_id, 2u);
  EXPECT_EQ(reps[0].m_result, to_value(3));
  EXPECT_FALSE(reps[0].m_err_code);
}

TEST_F(Command_proxy_test, Frame_defers_and_preserves_order)
{
  auto future = m_proxy.begin_frame_collection();
  ASSERT_EQ(m_sent.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<Frame_begin>(m_sent[0].m_body));
  EXPECT_NE(std::get<Frame_begin>(m_sent[0].m_body).m_time_ms, 0u);
  EXPECT_TRUE(m_proxy.buffering());

  dispatch(make_request(1, "draw", { to_value(1) }));
  Batch batch;
  batch.m_requests = { make_request(2, "draw", { to_value(2) }), make_request(3, "draw", { to_value(3) }, true) };
  m_proxy.dispatch(Envelope{ S_ID, std::move(batch) });
  dispatch(make_request(4, "draw", { to_value(4) }));

  EXPECT_EQ(m_proxy.n_queued(), 4u);
  EXPECT_TRUE(m_resource.m_call_log.empty());
  EXPECT_TRUE(replies().empty());

  m_proxy.dispatch(Envelope{ S_ID, Frame_end() });
  EXPECT_TRUE(future.is_ready());
  EXPECT_TRUE(m_resource.m_call_log.empty()); // Frame end alone executes nothing.

  m_proxy.flush();
  EXPECT_FALSE(m_proxy.buffering());
  EXPECT_EQ(m_proxy.n_queued(), 0u);
  EXPECT_EQ(m_resource.m_framebuffer, (std::vector<int64_t>{ 1, 2, 3, 4 }));
  ASSERT_EQ(replies().size(), 1u);
  EXPECT_EQ(replies()[0].m_request_id, 3u);
}

TEST_F(Command_proxy_test, Handle_round_trip_and_release)
{
  dispatch(make_request(1, "createTexture", {}, true));
  ASSERT_EQ(replies().size(), 1u);
  const auto handle_val = replies()[0].m_result;
  ASSERT_TRUE(std::holds_alternative<Handle_ref>(handle_val)); // Never the object itself.
  EXPECT_EQ(m_proxy.handles().size(), 1u);

  dispatch(make_request(2, "textureId", { handle_val }, true));
  ASSERT_EQ(replies().size(), 2u);
  EXPECT_EQ(replies()[1].m_result, to_value(1));

  m_proxy.dispatch(Envelope{ S_ID, Release{ std::get<Handle_ref>(handle_val).m_handle_id } });
  EXPECT_EQ(m_proxy.handles().size(), 0u);

  const auto n_calls = m_resource.m_call_log.size();
  dispatch(make_request(3, "textureId", { handle_val }, true));
  ASSERT_EQ(replies().size(), 3u);
  EXPECT_EQ(replies()[2].m_err_code, error::Code::S_DANGLING_HANDLE_REFERENCE);
  EXPECT_EQ(replies()[2].m_result, Value());
  EXPECT_EQ(m_resource.m_call_log.size(), n_calls); // The resource was not touched.

  // Releasing again is harmless.
  m_proxy.dispatch(Envelope{ S_ID, Release{ std::get<Handle_ref>(handle_val).m_handle_id } });
}

TEST_F(Command_proxy_test, Release_queued_in_order_during_frame)
{
  dispatch(make_request(1, "createTexture", {}, true));
  const auto handle_val = replies()[0].m_result;

  run_frame({ make_request(2, "textureId", { handle_val }, true) });
  EXPECT_EQ(replies().back().m_result, to_value(1));

  auto future = m_proxy.begin_frame_collection();
  m_proxy.dispatch(Envelope{ S_ID, Release{ std::get<Handle_ref>(handle_val).m_handle_id } });
  dispatch(make_request(3, "textureId", { handle_val }, true));
  EXPECT_EQ(m_proxy.handles().size(), 1u); // Not yet.
  m_proxy.dispatch(Envelope{ S_ID, Frame_end() });
  m_proxy.flush();

  EXPECT_EQ(m_proxy.handles().size(), 0u);
  EXPECT_EQ(replies().back().m_err_code, error::Code::S_DANGLING_HANDLE_REFERENCE);
}

TEST_F(Command_proxy_test, Sticky_state_replayed_after_external_change)
{
  run_frame({ make_request(1, "useProgram", { to_value(3) }),
              make_request(2, "bindBuffer", { to_value(34962), to_value(10) }),
              make_request(3, "bindBuffer", { to_value(34963), to_value(11) }),
              make_request(4, "useProgram", { to_value(5) }) });
  EXPECT_EQ(m_resource.m_program, 5);

  // Someone else (another requester, say) changed things meanwhile.
  m_resource.m_program = 99;
  m_resource.m_buffers[34962] = 0;
  m_resource.m_call_log.clear();
  const auto n_replies = replies().size();

  run_frame({ make_request(5, "currentProgram", {}, true), make_request(6, "boundBuffer", { to_value(34962) }, true) });

  // Replays (mode setter first) precede our requests, and are not answered.
  const std::vector<std::string> expected_log{ "useProgram", "bindBuffer", "bindBuffer", "currentProgram",
                                               "boundBuffer" };
  EXPECT_EQ(m_resource.m_call_log, expected_log);
  const auto reps = replies();
  ASSERT_EQ(reps.size(), n_replies + 2);
  EXPECT_EQ(reps[n_replies].m_result, to_value(5));
  EXPECT_EQ(reps[n_replies + 1].m_result, to_value(10));

  EXPECT_EQ(m_proxy.sticky_state().bindings().size(), 2u);
}

TEST_F(Command_proxy_test, Suppressed_and_unknown_operations_ignored)
{
  m_resource.m_framebuffer = { 7 };
  dispatch(make_request(1, "clear", {}, true));
  dispatch(make_request(2, "noSuchOperation", {}, true));

  EXPECT_EQ(m_resource.m_framebuffer, std::vector<int64_t>{ 7 });
  EXPECT_TRUE(m_resource.m_call_log.empty());
  EXPECT_TRUE(replies().empty());
  EXPECT_EQ(m_proxy.result_trace().size(), 0u);
}

TEST_F(Command_proxy_test, Foreign_and_unexpected_messages_ignored)
{
  m_proxy.dispatch(Envelope{ S_ID + 1, make_request(1, "draw", { to_value(1) }) });
  m_proxy.dispatch(Envelope{ S_ID, Reply{ 1, to_value(1), Error_code() } });
  m_proxy.dispatch(Envelope{ S_ID, Frame_begin{ 5 } });
  m_proxy.dispatch(Envelope{ S_ID, Frame_end() }); // No frame being collected.

  EXPECT_TRUE(m_resource.m_call_log.empty());
  EXPECT_TRUE(m_sent.empty());
}

TEST_F(Command_proxy_test, Malformed_batch_dropped_whole)
{
  Batch batch;
  batch.m_requests = { make_request(1, "draw", { to_value(1) }), make_request(2, ""),
                       make_request(3, "draw", { to_value(3) }) };
  m_proxy.dispatch(Envelope{ S_ID, std::move(batch) });

  dispatch(make_request(0, "draw", { to_value(4) }));

  EXPECT_TRUE(m_resource.m_call_log.empty());
}

TEST_F(Command_proxy_test, Operation_failures_reported)
{
  dispatch(make_request(1, "fail", {}, true));
  dispatch(make_request(2, "failWithCode", {}, true));
  dispatch(make_request(3, "useProgram", { to_value("three") }, true));
  dispatch(make_request(4, "useProgram", {}, true));
  dispatch(make_request(5, "fail")); // No reply wanted: nothing sent.

  const auto reps = replies();
  ASSERT_EQ(reps.size(), 4u);
  EXPECT_EQ(reps[0].m_err_code, error::Code::S_OPERATION_FAILED);
  EXPECT_EQ(reps[1].m_err_code, error::Code::S_ARGUMENT_TYPE_MISMATCH);
  EXPECT_EQ(reps[2].m_err_code, error::Code::S_ARGUMENT_TYPE_MISMATCH);
  EXPECT_EQ(reps[3].m_err_code, error::Code::S_ARGUMENT_TYPE_MISMATCH);
  EXPECT_EQ(m_resource.m_program, 0);
}

TEST_F(Command_proxy_test, Result_trace_records_primitives_only)
{
  dispatch(make_request(1, "useProgram", { to_value(8) }));
  dispatch(make_request(2, "currentProgram", {}, true));
  dispatch(make_request(3, "createTexture", {}, true));

  EXPECT_EQ(m_proxy.result_trace().size(), 1u);
  ASSERT_EQ(m_proxy.result_trace().entries("currentProgram").size(), 1u);
  EXPECT_EQ(m_proxy.result_trace().entries("currentProgram")[0].m_result, to_value(8));
}

TEST_F(Command_proxy_test, Frame_collection_errors)
{
  auto future = m_proxy.begin_frame_collection();
  ASSERT_TRUE(future.valid());

  Error_code err_code;
  auto second = m_proxy.begin_frame_collection(&err_code);
  EXPECT_EQ(err_code, error::Code::S_FRAME_COLLECTION_IN_PROGRESS);
  EXPECT_FALSE(second.valid());
  EXPECT_THROW(m_proxy.begin_frame_collection(), flow::error::Runtime_error);

  // Abandon it; then the link breaks.
  dispatch(make_request(1, "draw", { to_value(1) }));
  m_proxy.discard();
  EXPECT_FALSE(m_proxy.buffering());
  EXPECT_EQ(m_proxy.n_queued(), 0u);
  m_proxy.dispatch(Envelope{ S_ID, Frame_end() }); // Late: ignored.
  EXPECT_TRUE(m_resource.m_call_log.empty());

  m_send_err = error::Code::S_LINK_CLOSED;
  auto third = m_proxy.begin_frame_collection(&err_code);
  EXPECT_EQ(err_code, error::Code::S_LINK_CLOSED);
  EXPECT_FALSE(third.valid());
  EXPECT_FALSE(m_proxy.buffering());
}

TEST_F(Command_proxy_test, Abandoned_frame_rest_canceled)
{
  dispatch(make_request(1, "createTexture", {}, true));
  const auto handle_id = std::get<Handle_ref>(replies().back().m_result).m_handle_id;
  const auto n_calls = m_resource.m_call_log.size();

  auto abandoned = m_proxy.begin_frame_collection();
  dispatch(make_request(2, "draw", { to_value(1) }));
  dispatch(make_request(3, "currentProgram", {}, true));
  m_proxy.dispatch(Envelope{ S_ID, Release{ handle_id } });
  const auto n_replies = replies().size();
  m_proxy.discard(); // Frame end did not come in time.
  EXPECT_EQ(m_proxy.handles().size(), 0u); // Releases apply regardless.

  // Queued requests wanting an answer get one; the rest vanish.
  auto reps = replies();
  ASSERT_EQ(reps.size(), n_replies + 1);
  EXPECT_EQ(reps.back().m_request_id, 3u);
  EXPECT_EQ(reps.back().m_err_code, error::Code::S_REQUEST_CANCELED);
  EXPECT_EQ(m_resource.m_call_log.size(), n_calls);

  // The rest of the abandoned frame trickles in.
  dispatch(make_request(4, "draw", { to_value(2) }));
  dispatch(make_request(5, "currentProgram", {}, true));
  m_proxy.dispatch(Envelope{ S_ID, Frame_end() });
  EXPECT_TRUE(m_resource.m_framebuffer.empty());
  reps = replies();
  ASSERT_EQ(reps.size(), n_replies + 2);
  EXPECT_EQ(reps.back().m_request_id, 5u);
  EXPECT_EQ(reps.back().m_err_code, error::Code::S_REQUEST_CANCELED);

  // The next frame is normal.
  run_frame({ make_request(6, "draw", { to_value(3) }) });
  EXPECT_EQ(m_resource.m_framebuffer, std::vector<int64_t>{ 3 });
}

TEST_F(Command_proxy_test, Failed_setters_not_sticky)
{
  run_frame({ make_request(1, "useProgram", { to_value(3) }),
              make_request(2, "bindBuffer", { to_value(34962), to_value(10) }) });

  // Setters that fail take no effect, so they must not displace the ones that did.
  dispatch(make_request(3, "useProgram", { to_value("three") }, true));
  dispatch(make_request(4, "bindBuffer", { to_value(34962) }, true));
  ASSERT_EQ(replies().size(), 2u);
  EXPECT_EQ(replies()[0].m_err_code, error::Code::S_ARGUMENT_TYPE_MISMATCH);
  EXPECT_EQ(replies()[1].m_err_code, error::Code::S_ARGUMENT_TYPE_MISMATCH);

  ASSERT_TRUE(m_proxy.sticky_state().mode_setter());
  EXPECT_EQ(m_proxy.sticky_state().mode_setter()->m_request_id, 1u);
  ASSERT_EQ(m_proxy.sticky_state().bindings().size(), 1u);
  EXPECT_EQ(m_proxy.sticky_state().bindings().begin()->second.m_request_id, 2u);

  // Someone else changed things meanwhile; the next frame restores the last good state.
  m_resource.m_program = 99;
  m_resource.m_buffers[34962] = 0;
  run_frame({});
  EXPECT_EQ(m_resource.m_program, 3);
  EXPECT_EQ(m_resource.m_buffers[34962], 10);
}

} // namespace glproxy::owner::test
