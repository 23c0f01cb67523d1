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
#include "glproxy/transport/msg_channel.hpp"
#include <flow/error/error.hpp>
#include <cassert>
#include <ostream>

namespace glproxy::transport
{

Msg_channel::Msg_channel(flow::log::Logger* logger_ptr, Link_ptr&& link, const Codec_config& codec_config) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_codec(logger_ptr, codec_config),
  m_link(std::move(link))
{
  assert(m_link && "Link must not be null.");
  FLOW_LOG_INFO("Msg_channel [" << *this << "]: Created over link; segment size [" << codec_config.m_segment_sz << "].");
}

Msg_channel::~Msg_channel()
{
  FLOW_LOG_INFO("Msg_channel [" << *this << "]: Shutting down.");
  m_link.reset();
}

bool Msg_channel::start(On_envelope_func&& on_msg_func, On_err_func&& on_err_func)
{
  using flow::util::Blob;

  return m_link->start_receive([this, on_msg_func = std::move(on_msg_func)](Blob& blob)
  {
    // We are in the link's thread.

    Envelope msg;
    Error_code err_code;
    m_codec.decode(blob, &msg, &err_code);
    if (err_code)
    {
      // It logged details.
      FLOW_LOG_WARNING("Msg_channel [" << *this << "]: Inbound blob sized [" << blob.size() << "] rejected: "
                       "[" << err_code << "] [" << err_code.message() << "].  Dropping it.");
      return;
    }
    // else

    FLOW_LOG_TRACE("Msg_channel [" << *this << "]: Received message [" << msg << "].");
    on_msg_func(std::move(msg));
  },
                               [this, on_err_func = std::move(on_err_func)](const Error_code& err_code)
  {
    FLOW_LOG_INFO("Msg_channel [" << *this << "]: Link broke: [" << err_code << "] [" << err_code.message() << "].");
    on_err_func(err_code);
  });
} // Msg_channel::start()

void Msg_channel::send(const Envelope& msg, Error_code* err_code)
{
  using flow::util::Blob;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send(msg, actual_err_code); },
         err_code, "glproxy::transport::Msg_channel::send()"))
  {
    return;
  }
  // If got here: err_code is not null.

  Blob serialization(get_logger());
  m_codec.encode(msg, &serialization, err_code);
  if (*err_code)
  {
    return; // It logged.
  }
  // else

  FLOW_LOG_TRACE("Msg_channel [" << *this << "]: Sending message [" << msg << "] "
                 "(serialization sized [" << serialization.size() << "]).");
  m_link->send_blob(serialization, err_code);
}

const Blob_link& Msg_channel::link() const
{
  return *m_link;
}

std::ostream& operator<<(std::ostream& os, const Msg_channel& val)
{
  return os << "[link " << val.link() << "]@" << static_cast<const void*>(&val);
}

} // namespace glproxy::transport
