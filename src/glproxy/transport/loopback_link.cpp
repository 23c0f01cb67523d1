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
#include "glproxy/transport/loopback_link.hpp"
#include "glproxy/error.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <cstring>

namespace glproxy::transport
{

Loopback_link::Loopback_link(flow::log::Logger* logger_ptr, std::string&& nickname,
                             const boost::shared_ptr<Pair_state>& pair_state, size_t end_idx) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(std::move(nickname)),
  m_pair_state(pair_state),
  m_end_idx(end_idx),
  m_started(false),
  m_peer_gone(false),
  m_err_reported(false),
  m_worker(get_logger(), m_nickname)
{
  m_worker.start();
  FLOW_LOG_TRACE("Loopback_link [" << *this << "]: Created; worker thread started.");
}

std::pair<Loopback_link::Ptr, Loopback_link::Ptr>
  Loopback_link::make_pair(flow::log::Logger* logger_ptr, String_view nickname) // Static.
{
  const auto pair_state = boost::make_shared<Pair_state>();
  const std::string base(nickname);

  Ptr end_a(new Loopback_link(logger_ptr, base + "-a", pair_state, 0));
  Ptr end_b(new Loopback_link(logger_ptr, base + "-b", pair_state, 1));
  {
    Lock_guard lock(pair_state->m_mutex);
    pair_state->m_ends[0] = end_a.get();
    pair_state->m_ends[1] = end_b.get();
  }

  return std::make_pair(std::move(end_a), std::move(end_b));
}

Loopback_link::~Loopback_link()
{
  FLOW_LOG_INFO("Loopback_link [" << *this << "]: Shutting down; the other end (if still around) shall be told "
                "the link is closed.");
  {
    Lock_guard lock(m_pair_state->m_mutex);
    m_pair_state->m_ends[m_end_idx] = nullptr;
    const auto peer = m_pair_state->m_ends[1 - m_end_idx];
    if (peer)
    {
      peer->on_peer_gone();
    }
  }
  // No more on_peer_*() calls into us.  Now any running handler finishes; queued ones are dropped.

  m_worker.stop();
}

bool Loopback_link::start_receive(On_blob_func&& on_blob_func, On_err_func&& on_err_func)
{
  {
    Lock_guard lock(m_mutex);
    if (m_started)
    {
      FLOW_LOG_WARNING("Loopback_link [" << *this << "]: start_receive() invoked, but already started.  Ignoring.");
      return false;
    }
    // else
    m_started = true;
    m_on_blob_func = std::move(on_blob_func);
    m_on_err_func = std::move(on_err_func);

    FLOW_LOG_TRACE("Loopback_link [" << *this << "]: Started receiving; [" << m_inbox.size() << "] blobs "
                   "already queued.");
  }

  m_worker.post([this]() { deliver_queued(); });
  return true;
} // Loopback_link::start_receive()

void Loopback_link::send_blob(const flow::util::Blob& blob, Error_code* err_code)
{
  using flow::util::Blob;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send_blob(blob, actual_err_code); },
         err_code, "glproxy::transport::Loopback_link::send_blob()"))
  {
    return;
  }
  // If got here: err_code is not null.

  // Copy it first (outside the lock): caller may discard theirs immediately.
  const auto copy = boost::make_shared<Blob>(get_logger(), blob.size());
  if (blob.size() != 0)
  {
    std::memcpy(copy->begin(), blob.const_data(), blob.size());
  }

  Lock_guard lock(m_pair_state->m_mutex);
  const auto peer = m_pair_state->m_ends[1 - m_end_idx];
  if (!peer)
  {
    FLOW_LOG_WARNING("Loopback_link [" << *this << "]: Cannot send blob sized [" << blob.size() << "]: "
                     "other end is gone.  Emitting error.");
    *err_code = error::Code::S_LINK_CLOSED;
    return;
  }
  // else

  FLOW_LOG_TRACE("Loopback_link [" << *this << "]: Handing blob sized [" << blob.size() << "] to "
                 "[" << *peer << "].");
  peer->on_peer_blob(copy);
  err_code->clear();
} // Loopback_link::send_blob()

void Loopback_link::on_peer_blob(const Blob_ptr& blob)
{
  // We are in some sender thread.  m_pair_state->m_mutex is locked.
  {
    Lock_guard lock(m_mutex);
    m_inbox.push_back(blob);
  }
  m_worker.post([this]() { deliver_queued(); });
}

void Loopback_link::on_peer_gone()
{
  // m_pair_state->m_mutex is locked.
  {
    Lock_guard lock(m_mutex);
    m_peer_gone = true;
  }
  m_worker.post([this]() { deliver_queued(); });
}

void Loopback_link::deliver_queued()
{
  // We are in thread W.

  while (true)
  {
    Blob_ptr blob;
    {
      Lock_guard lock(m_mutex);
      if ((!m_started) || m_err_reported)
      {
        return;
      }
      // else

      if (!m_inbox.empty())
      {
        blob = std::move(m_inbox.front());
        m_inbox.pop_front();
      }
      else if (m_peer_gone)
      {
        m_err_reported = true;
      }
      else
      {
        return;
      }
    } // Lock_guard lock(m_mutex);
    // Unlock before invoking handler: it may well send_blob() or whatever.

    if (!blob)
    {
      FLOW_LOG_INFO("Loopback_link [" << *this << "]: Other end is gone; reporting link closure to user.");
      m_on_err_func(error::Code::S_LINK_CLOSED);
      return;
    }
    // else

    FLOW_LOG_TRACE("Loopback_link [" << *this << "]: Handing received blob sized [" << blob->size() << "] "
                   "to user.");
    m_on_blob_func(*blob);
  } // while (true)
} // Loopback_link::deliver_queued()

const std::string& Loopback_link::nickname() const
{
  return m_nickname;
}

} // namespace glproxy::transport
