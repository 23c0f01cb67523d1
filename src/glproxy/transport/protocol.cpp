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
#include "glproxy/transport/protocol.hpp"
#include <iterator>
#include <ostream>

namespace glproxy::transport
{

String_view body_type_name(const Envelope& val)
{
  constexpr String_view NAMES[] = { "bootstrap", "request", "batch", "reply", "frame-begin", "frame-end", "release" };
  static_assert(std::size(NAMES) == std::variant_size_v<Envelope::Body>, "Keep NAMES in sync with Envelope::Body.");

  return NAMES[val.m_body.index()];
}

std::ostream& operator<<(std::ostream& os, const Request& val)
{
  os << "req#" << val.m_request_id << ' ' << val.m_name << val.m_args;
  if (val.m_wants_response)
  {
    os << " (wants-rsp)";
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, const Envelope& val)
{
  os << '[' << body_type_name(val) << " requester [" << val.m_requester_id << "]";

  std::visit([&](const auto& body)
  {
    using Body = std::decay_t<decltype(body)>;

    if constexpr(std::is_same_v<Body, Request>)
    {
      os << ": " << body;
    }
    else if constexpr(std::is_same_v<Body, Batch>)
    {
      os << ": [" << body.m_requests.size() << "] requests";
    }
    else if constexpr(std::is_same_v<Body, Reply>)
    {
      os << ": req#" << body.m_request_id << " => " << body.m_result;
      if (body.m_err_code)
      {
        os << " error [" << body.m_err_code << "] [" << body.m_err_code.message() << ']';
      }
    }
    else if constexpr(std::is_same_v<Body, Frame_begin>)
    {
      os << ": time [" << body.m_time_ms << "ms]";
    }
    else if constexpr(std::is_same_v<Body, Release>)
    {
      os << ": handle#" << body.m_handle_id;
    }
    // else { Bootstrap is big; Frame_end has no fields. }
  }, val.m_body);

  return os << ']';
} // operator<<(Envelope)

} // namespace glproxy::transport
