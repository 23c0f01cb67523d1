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
#include "glproxy/transport/socket_link.hpp"
#include "glproxy/error.hpp"
#include <flow/error/error.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/make_shared.hpp>
#include <cassert>
#include <cstring>

namespace glproxy::transport
{

Socket_link::Socket_link(flow::log::Logger* logger_ptr, String_view nickname, Native_handle native_handle,
                         Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname),
  m_worker(get_logger(), m_nickname),
  m_socket(*m_worker.task_engine()),
  m_rcv_header(),
  m_snd_in_progress(false),
  m_hosed(false),
  m_started(false),
  m_err_reported(false)
{
  Error_code sys_err_code;
  m_socket.assign(boost::asio::local::stream_protocol(), native_handle, sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Socket_link [" << *this << "]: Could not adopt native handle [" << native_handle << "]: "
                     "[" << sys_err_code << "] [" << sys_err_code.message() << "].  Link is unusable.");
    m_hosed = true;
    if (err_code)
    {
      *err_code = sys_err_code;
      return;
    }
    // else
    throw flow::error::Runtime_error(sys_err_code, "glproxy::transport::Socket_link::Socket_link()");
  }
  // else

  m_worker.start();
  FLOW_LOG_INFO("Socket_link [" << *this << "]: Adopted native handle [" << native_handle << "]; worker thread "
                "started.");
  if (err_code)
  {
    err_code->clear();
  }
} // Socket_link::Socket_link()

Socket_link::~Socket_link()
{
  FLOW_LOG_INFO("Socket_link [" << *this << "]: Shutting down; socket shall close.");

  /* Any running handler finishes; then no more.  The socket, destroyed next, cancels its async ops; their
   * handlers are discarded with the Task_engine (never run). */
  m_worker.stop();
}

std::pair<Socket_link::Ptr, Socket_link::Ptr>
  Socket_link::connect_pair(flow::log::Logger* logger_ptr, String_view nickname) // Static.
{
  boost::asio::io_context dummy;
  Peer_socket sock_a(dummy);
  Peer_socket sock_b(dummy);
  boost::asio::local::connect_pair(sock_a, sock_b); // Throws on error (rare: out of descriptors or similar).

  const std::string base(nickname);
  Ptr end_a(new Socket_link(logger_ptr, base + "-a", sock_a.release()));
  Ptr end_b(new Socket_link(logger_ptr, base + "-b", sock_b.release()));
  return std::make_pair(std::move(end_a), std::move(end_b));
}

bool Socket_link::start_receive(On_blob_func&& on_blob_func, On_err_func&& on_err_func)
{
  {
    Lock_guard lock(m_mutex);
    if (m_started)
    {
      FLOW_LOG_WARNING("Socket_link [" << *this << "]: start_receive() invoked, but already started.  Ignoring.");
      return false;
    }
    // else
    m_started = true;
    m_on_blob_func = std::move(on_blob_func);
    m_on_err_func = std::move(on_err_func);
  }

  m_worker.post([this]()
  {
    bool hosed;
    {
      Lock_guard lock(m_mutex);
      hosed = m_hosed;
    }
    if (hosed)
    {
      report_hosed_if_due(); // E.g., a write failed before we started reading.
      return;
    }
    // else
    read_header();
  });
  return true;
} // Socket_link::start_receive()

void Socket_link::send_blob(const flow::util::Blob& blob, Error_code* err_code)
{
  using flow::util::Blob;
  using boost::endian::native_to_little;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send_blob(blob, actual_err_code); },
         err_code, "glproxy::transport::Socket_link::send_blob()"))
  {
    return;
  }
  // If got here: err_code is not null.

  const auto framed = boost::make_shared<Blob>(get_logger(), S_HEADER_SZ + blob.size());
  const uint64_t sz_le = native_to_little(static_cast<uint64_t>(blob.size()));
  std::memcpy(framed->begin(), &sz_le, S_HEADER_SZ);
  if (blob.size() != 0)
  {
    std::memcpy(framed->begin() + S_HEADER_SZ, blob.const_data(), blob.size());
  }

  Lock_guard lock(m_mutex);
  if (m_hosed)
  {
    FLOW_LOG_WARNING("Socket_link [" << *this << "]: Cannot send blob sized [" << blob.size() << "]: link is "
                     "broken.  Emitting error.");
    *err_code = error::Code::S_LINK_CLOSED;
    return;
  }
  // else

  FLOW_LOG_TRACE("Socket_link [" << *this << "]: Queuing blob sized [" << blob.size() << "]; "
                 "[" << m_snd_queue.size() << "] ahead of it.");
  m_snd_queue.push_back(framed);
  if (!m_snd_in_progress)
  {
    m_snd_in_progress = true;
    m_worker.post([this]() { write_next(); });
  }
  err_code->clear();
} // Socket_link::send_blob()

void Socket_link::write_next()
{
  // We are in thread W.

  Blob_ptr framed;
  {
    Lock_guard lock(m_mutex);
    assert(m_snd_in_progress && (!m_snd_queue.empty()));
    framed = m_snd_queue.front();
  }

  boost::asio::async_write(m_socket, boost::asio::buffer(framed->const_data(), framed->size()),
                           [this, framed](const Error_code& sys_err_code, size_t)
  {
    // We are in thread W.

    if (sys_err_code)
    {
      hose(sys_err_code);
      return;
    }
    // else

    bool more;
    {
      Lock_guard lock(m_mutex);
      m_snd_queue.pop_front();
      more = !m_snd_queue.empty();
      m_snd_in_progress = more;
    }
    if (more)
    {
      write_next();
    }
  });
} // Socket_link::write_next()

void Socket_link::read_header()
{
  using boost::endian::little_to_native;

  // We are in thread W.

  boost::asio::async_read(m_socket, boost::asio::buffer(m_rcv_header),
                          [this](const Error_code& sys_err_code, size_t)
  {
    if (sys_err_code)
    {
      hose(sys_err_code);
      return;
    }
    // else

    uint64_t sz_le;
    std::memcpy(&sz_le, m_rcv_header.data(), S_HEADER_SZ);
    const uint64_t blob_sz = little_to_native(sz_le);
    if (blob_sz > S_MAX_BLOB_SZ)
    {
      FLOW_LOG_WARNING("Socket_link [" << *this << "]: Peer announced blob sized [" << blob_sz << "] exceeding "
                       "limit [" << S_MAX_BLOB_SZ << "]; stream is garbage or hostile.");
      hose(error::Code::S_PROTOCOL_MALFORMED_MESSAGE);
      return;
    }
    // else

    read_body(static_cast<size_t>(blob_sz));
  });
} // Socket_link::read_header()

void Socket_link::read_body(size_t blob_sz)
{
  using flow::util::Blob;

  // We are in thread W.

  m_rcv_blob = Blob(get_logger(), blob_sz);

  const auto on_body = [this](const Error_code& sys_err_code, size_t)
  {
    if (sys_err_code)
    {
      hose(sys_err_code);
      return;
    }
    // else

    FLOW_LOG_TRACE("Socket_link [" << *this << "]: Handing received blob sized [" << m_rcv_blob.size() << "] "
                   "to user.");
    m_on_blob_func(m_rcv_blob);
    read_header();
  };

  if (blob_sz == 0)
  {
    on_body(Error_code(), 0);
    return;
  }
  // else
  boost::asio::async_read(m_socket, boost::asio::buffer(m_rcv_blob.begin(), blob_sz), on_body);
} // Socket_link::read_body()

void Socket_link::hose(const Error_code& cause)
{
  // We are in thread W.
  {
    Lock_guard lock(m_mutex);
    if (m_hosed)
    {
      return;
    }
    // else
    m_hosed = true;
  }

  if (cause == boost::asio::error::eof)
  {
    FLOW_LOG_INFO("Socket_link [" << *this << "]: Peer closed the connection.");
  }
  else
  {
    FLOW_LOG_WARNING("Socket_link [" << *this << "]: Link broken: [" << cause << "] [" << cause.message() << "].");
  }

  report_hosed_if_due();
}

void Socket_link::report_hosed_if_due()
{
  // We are in thread W.
  {
    Lock_guard lock(m_mutex);
    if ((!m_hosed) || (!m_started) || m_err_reported)
    {
      return;
    }
    // else
    m_err_reported = true;
  }

  m_on_err_func(error::Code::S_LINK_CLOSED);
}

const std::string& Socket_link::nickname() const
{
  return m_nickname;
}

} // namespace glproxy::transport
