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
#include "glproxy/transport/msg_channel.hpp"
#include "glproxy/transport/loopback_link.hpp"
#include "glproxy/transport/socket_link.hpp"
#include <boost/thread/future.hpp>
#include <boost/make_shared.hpp>
#include <gtest/gtest.h>
#include <cstring>

namespace glproxy::transport::test
{

using glproxy::test::test_logger;
using glproxy::test::make_request;
using flow::util::Blob;

namespace
{

const auto S_WAIT = boost::chrono::seconds(10);

/// Starts the channel, collecting up to `n` messages; the returned future resolves when `n` have arrived.
boost::unique_future<void> collect(Msg_channel* channel, std::vector<Envelope>* received, size_t n,
                                   boost::promise<Error_code>* err)
{
  const auto done = boost::make_shared<boost::promise<void>>();
  auto future = done->get_future();
  channel->start([received, n, done](Envelope&& msg)
  {
    received->push_back(std::move(msg));
    if (received->size() == n)
    {
      done->set_value();
    }
  },
                 [err](const Error_code& err_code) { err->set_value(err_code); });
  return future;
}

} // namespace (anonymous)

TEST(Msg_channel, Messages_in_order_over_sockets)
{
  const size_t N = 50;
  std::vector<Envelope> received;
  boost::promise<Error_code> err;

  auto links = Socket_link::connect_pair(test_logger(), "test");
  Msg_channel snd(test_logger(), Msg_channel::Link_ptr(std::move(links.first)));
  Msg_channel rcv(test_logger(), Msg_channel::Link_ptr(std::move(links.second)));
  auto done = collect(&rcv, &received, N, &err);

  for (size_t idx = 0; idx != N; ++idx)
  {
    snd.send(Envelope{ 7, make_request(idx + 1, "draw", { to_value(idx) }) });
  }

  ASSERT_EQ(done.wait_for(S_WAIT), boost::future_status::ready);
  for (size_t idx = 0; idx != N; ++idx)
  {
    const auto& req = std::get<Request>(received[idx].m_body);
    EXPECT_EQ(req.m_request_id, idx + 1);
    EXPECT_EQ(req.m_args, Value_list{ to_value(idx) });
  }
}

TEST(Msg_channel, Garbage_dropped_then_link_closure_reported)
{
  std::vector<Envelope> received;
  boost::promise<Error_code> err;
  auto err_future = err.get_future();

  auto links = Loopback_link::make_pair(test_logger(), "test");
  auto raw_end = std::move(links.first);
  Msg_channel rcv(test_logger(), Msg_channel::Link_ptr(std::move(links.second)));
  auto done = collect(&rcv, &received, 1, &err);

  raw_end->send_blob(Blob(test_logger(), 5)); // Misaligned.
  Blob zeroes(test_logger(), 64);
  std::memset(zeroes.begin(), 0, zeroes.size());
  raw_end->send_blob(zeroes); // Not a well-formed message.

  const Msg_codec codec(test_logger());
  Blob good;
  codec.encode(Envelope{ 7, Frame_end() }, &good);
  raw_end->send_blob(good);

  ASSERT_EQ(done.wait_for(S_WAIT), boost::future_status::ready);
  ASSERT_EQ(received.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<Frame_end>(received.front().m_body));

  raw_end.reset();
  ASSERT_EQ(err_future.wait_for(S_WAIT), boost::future_status::ready);
  EXPECT_EQ(err_future.get(), error::Code::S_LINK_CLOSED);
}

TEST(Msg_channel, Send_errors)
{
  auto links = Loopback_link::make_pair(test_logger(), "test");
  Msg_channel snd(test_logger(), Msg_channel::Link_ptr(std::move(links.first)));

  Error_code err_code;
  snd.send(Envelope{ 7, Reply{ 1, to_value(boost::make_shared<glproxy::test::Test_texture>(1)), Error_code() } },
           &err_code);
  EXPECT_EQ(err_code, error::Code::S_SERIALIZE_NON_TRANSFERABLE_VALUE);

  links.second.reset();
  snd.send(Envelope{ 7, Frame_end() }, &err_code);
  EXPECT_EQ(err_code, error::Code::S_LINK_CLOSED);
  EXPECT_THROW(snd.send(Envelope{ 7, Frame_end() }), flow::error::Runtime_error);
}

} // namespace glproxy::transport::test
