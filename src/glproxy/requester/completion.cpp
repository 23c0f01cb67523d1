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
#include "glproxy/requester/completion.hpp"
#include <flow/error/error.hpp>
#include <cassert>

namespace glproxy::requester
{

Completion::Completion() :
  m_request_id(0),
  m_default_timeout(Fine_duration::max())
{
  // That's it.
}

Completion::Completion(boost::unique_future<Call_result>&& future, transport::request_id_t request_id,
                       Fine_duration default_timeout) :
  m_future(std::move(future)),
  m_request_id(request_id),
  m_default_timeout(default_timeout)
{
  // That's it.
}

Completion Completion::failed(const Error_code& err_code) // Static.
{
  assert(err_code && "Use a real failure.");

  boost::promise<Call_result> promise;
  promise.set_value(Call_result{ transport::Value(), err_code });
  return Completion(promise.get_future(), 0, Fine_duration::max());
}

bool Completion::valid() const
{
  return m_future.valid();
}

bool Completion::ready() const
{
  return m_future.valid() && m_future.is_ready();
}

transport::request_id_t Completion::request_id() const
{
  return m_request_id;
}

transport::Value Completion::get(Error_code* err_code)
{
  return get(m_default_timeout, err_code);
}

transport::Value Completion::get(Fine_duration timeout, Error_code* err_code)
{
  transport::Value result;
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { result = get(timeout, actual_err_code); },
         err_code, "glproxy::requester::Completion::get()"))
  {
    return result;
  }
  // If got here: err_code is not null.

  assert(valid() && "get() on a consumed or default-constructed Completion.");

  // wait_for() misbehaves with huge durations; hence the special case.
  if (timeout == Fine_duration::max())
  {
    m_future.wait();
  }
  else if (m_future.wait_for(timeout) != boost::future_status::ready)
  {
    *err_code = error::Code::S_PEER_UNRESPONSIVE;
    return result;
  }
  // else: Resolved.

  auto call_result = m_future.get(); // Consumes it; now !valid().
  *err_code = call_result.m_err_code;
  if (!*err_code)
  {
    result = std::move(call_result.m_value);
  }
  return result;
} // Completion::get()

} // namespace glproxy::requester
