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
#include "glproxy/transport/loopback_link.hpp"
#include "glproxy/transport/socket_link.hpp"
#include <flow/util/blob.hpp>
#include <boost/thread/future.hpp>
#include <gtest/gtest.h>
#include <cstring>

namespace glproxy::transport::test
{

using glproxy::test::test_logger;
using flow::util::Blob;

namespace
{

const auto S_WAIT = boost::chrono::seconds(10);

/// Receiving end of a test: collects blob contents (as strings); resolves futures at the expected count and on error.
class Collector
{
public:
  explicit Collector(size_t n_expected) :
    m_n_expected(n_expected)
  {
    // Nothing else.
  }

  void start(Blob_link* link)
  {
    ASSERT_TRUE(link->start_receive([this](Blob& blob)
    {
      if (blob.size() == 0)
      {
        m_received.emplace_back();
      }
      else
      {
        m_received.emplace_back(reinterpret_cast<const char*>(blob.const_data()), blob.size());
      }
      if (m_received.size() == m_n_expected)
      {
        m_all_received.set_value();
      }
    },
                                    [this](const Error_code& err_code) { m_err.set_value(err_code); }));
  }

  std::vector<std::string> m_received;
  const size_t m_n_expected;
  boost::promise<void> m_all_received;
  boost::promise<Error_code> m_err;
};

Blob to_blob(const std::string& str)
{
  Blob blob(test_logger(), str.size());
  if (!str.empty())
  {
    std::memcpy(blob.begin(), str.data(), str.size());
  }
  return blob;
}

/// Sends `n` numbered blobs one way; checks arrival in order; then closes the sender, checking closure is reported.
template<typename Link_ptr>
void check_link_pair(Link_ptr&& snd, Link_ptr&& rcv, size_t n)
{
  Collector collector(n);
  auto all_received = collector.m_all_received.get_future();
  auto err = collector.m_err.get_future();

  // Send some before receiver starts: they must wait, not vanish.
  snd->send_blob(to_blob("msg-0"));
  collector.start(rcv.get());
  for (size_t idx = 1; idx != n; ++idx)
  {
    snd->send_blob(to_blob("msg-" + std::to_string(idx)));
  }

  ASSERT_EQ(all_received.wait_for(S_WAIT), boost::future_status::ready);
  for (size_t idx = 0; idx != n; ++idx)
  {
    EXPECT_EQ(collector.m_received[idx], "msg-" + std::to_string(idx));
  }

  EXPECT_FALSE(rcv->start_receive([](Blob&) {}, [](const Error_code&) {})); // Second start is a no-op.

  snd.reset();
  ASSERT_EQ(err.wait_for(S_WAIT), boost::future_status::ready);
  EXPECT_EQ(err.get(), error::Code::S_LINK_CLOSED);

  Error_code err_code;
  rcv->send_blob(to_blob("into the void"), &err_code);
  EXPECT_EQ(err_code, error::Code::S_LINK_CLOSED);
}

} // namespace (anonymous)

TEST(Loopback_link, Order_and_closure)
{
  auto links = Loopback_link::make_pair(test_logger(), "test");
  EXPECT_EQ(links.first->nickname(), "test-a");
  EXPECT_EQ(links.second->nickname(), "test-b");
  check_link_pair(std::move(links.first), std::move(links.second), 100);
}

TEST(Socket_link, Order_and_closure)
{
  auto links = Socket_link::connect_pair(test_logger(), "test");
  check_link_pair(std::move(links.first), std::move(links.second), 100);
}

TEST(Socket_link, Large_and_empty_blobs)
{
  auto links = Socket_link::connect_pair(test_logger(), "test");
  Collector collector(2);
  auto all_received = collector.m_all_received.get_future();
  collector.start(links.second.get());

  const std::string big(3 * 1024 * 1024, 'z');
  links.first->send_blob(to_blob(big));
  links.first->send_blob(Blob());

  ASSERT_EQ(all_received.wait_for(S_WAIT), boost::future_status::ready);
  EXPECT_EQ(collector.m_received[0], big);
  EXPECT_TRUE(collector.m_received[1].empty());
}

} // namespace glproxy::transport::test
