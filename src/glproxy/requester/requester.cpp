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
#include "glproxy/requester/requester.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <cassert>

namespace glproxy::requester
{

Requester::Requester(flow::log::Logger* logger_ptr, transport::requester_id_t requester_id,
                     transport::Msg_channel::Link_ptr&& link, const Requester_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_REQUESTER),
  m_id(requester_id),
  m_config(config),
  m_started(false),
  m_bootstrapped(false),
  m_link_closed(false),
  m_next_request_id(1),
  m_collecting_batch(false),
  m_user_loop(get_logger(), "requester_user"),
  m_channel(new transport::Msg_channel(get_logger(), std::move(link)))
{
  assert((m_id != 0) && "Requester ID 0 is a sentinel.");
  FLOW_LOG_INFO("Requester [" << m_id << "]: Created over channel [" << *m_channel << "]; "
                "batching of frame calls [" << m_config.m_batch_frame_calls << "].");
}

Requester::~Requester()
{
  FLOW_LOG_INFO("Requester [" << m_id << "]: Shutting down.  [" << n_pending() << "] calls still pending shall be "
                "canceled.");

  m_user_loop.stop(); // A running handler (which might be issuing calls) finishes; no more after that.
  m_channel.reset(); // No more messages (hence replies) after this.
  fail_pending(error::Code::S_REQUEST_CANCELED);
}

bool Requester::start(On_bootstrap_func&& on_bootstrap_func, On_frame_func&& on_frame_func,
                      On_err_func&& on_err_func)
{
  {
    Lock_guard lock(m_mutex);
    if (m_started)
    {
      FLOW_LOG_WARNING("Requester [" << m_id << "]: start() invoked, but already started.  Ignoring.");
      return false;
    }
    // else
    m_started = true;
  }

  m_on_bootstrap_func = std::move(on_bootstrap_func);
  m_on_frame_func = std::move(on_frame_func);
  m_on_err_func = std::move(on_err_func);

  m_user_loop.start();
  return m_channel->start([this](transport::Envelope&& msg) { on_msg(std::move(msg)); },
                          [this](const Error_code& err_code)
  {
    // We are in thread W.
    FLOW_LOG_WARNING("Requester [" << m_id << "]: Link to owner broke; failing pending calls; informing user.");
    {
      Lock_guard lock(m_mutex);
      m_link_closed = true;
    }
    fail_pending(error::Code::S_LINK_CLOSED);
    m_user_loop.post([this, err_code]() { m_on_err_func(err_code); });
  });
} // Requester::start()

Call_stub Requester::stub(String_view name, Error_code* err_code)
{
  Call_stub result;
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { result = stub(name, actual_err_code); },
         err_code, "glproxy::requester::Requester::stub()"))
  {
    return result;
  }
  // If got here: err_code is not null.

  const std::string name_str(name);

  Lock_guard lock(m_mutex);
  if (!m_bootstrapped)
  {
    *err_code = error::Code::S_NOT_BOOTSTRAPPED;
    return result;
  }
  if (m_operation_names.count(name_str) == 0)
  {
    FLOW_LOG_WARNING("Requester [" << m_id << "]: Stub requested for operation [" << name_str << "] not offered "
                     "by owner.  Emitting error.");
    *err_code = error::Code::S_UNKNOWN_OPERATION;
    return result;
  }
  // else

  err_code->clear();
  return Call_stub(this, name_str);
} // Requester::stub()

transport::Value Requester::constant(String_view name, Error_code* err_code) const
{
  transport::Value result;
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { result = constant(name, actual_err_code); },
         err_code, "glproxy::requester::Requester::constant()"))
  {
    return result;
  }
  // If got here: err_code is not null.

  Lock_guard lock(m_mutex);
  if (!m_bootstrapped)
  {
    *err_code = error::Code::S_NOT_BOOTSTRAPPED;
    return result;
  }
  // else

  const auto it = m_constants.find(std::string(name));
  if (it == m_constants.end())
  {
    *err_code = error::Code::S_UNKNOWN_OPERATION;
    return result;
  }
  // else

  err_code->clear();
  return it->second;
} // Requester::constant()

void Requester::release(const transport::Handle_ref& handle, Error_code* err_code)
{
  using transport::Envelope;
  using transport::Release;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { release(handle, actual_err_code); },
         err_code, "glproxy::requester::Requester::release()"))
  {
    return;
  }
  // If got here: err_code is not null.

  Lock_guard lock(m_mutex);
  if (!m_bootstrapped)
  {
    *err_code = error::Code::S_NOT_BOOTSTRAPPED;
    return;
  }
  // else

  FLOW_LOG_TRACE("Requester [" << m_id << "]: Releasing [" << handle << "].");
  send_locked(Envelope{ m_id, Release{ handle.m_handle_id } }, err_code);
}

Completion Requester::issue(const std::string& name, transport::Value_list&& args, bool wants_response)
{
  using transport::Envelope;
  using transport::Request;
  using boost::promise;

  Lock_guard lock(m_mutex);

  if (!m_bootstrapped)
  {
    FLOW_LOG_WARNING("Requester [" << m_id << "]: Call to [" << name << "] before bootstrap.  Failing it.");
    return Completion::failed(error::Code::S_NOT_BOOTSTRAPPED);
  }
  if (m_operation_names.count(name) == 0)
  {
    FLOW_LOG_WARNING("Requester [" << m_id << "]: Call to [" << name << "] not offered by owner.  Failing it.");
    return Completion::failed(error::Code::S_UNKNOWN_OPERATION);
  }
  if (m_link_closed)
  {
    return Completion::failed(error::Code::S_LINK_CLOSED);
  }
  // else

  const auto request_id = m_next_request_id++;
  Request req{ request_id, name, std::move(args), wants_response };

  Completion completion;
  if (wants_response)
  {
    const auto promise_ptr = boost::make_shared<promise<Call_result>>();
    completion = Completion(promise_ptr->get_future(), request_id, m_config.m_reply_timeout);
    m_pending.emplace(request_id, promise_ptr);
  }

  FLOW_LOG_TRACE("Requester [" << m_id << "]: Issuing [" << req << "].");

  Error_code err_code;
  send_locked(Envelope{ m_id, std::move(req) }, &err_code);
  if (err_code)
  {
    m_pending.erase(request_id);
    return Completion::failed(err_code);
  }
  // else
  return completion;
} // Requester::issue()

void Requester::send_locked(transport::Envelope&& msg, Error_code* err_code)
{
  using transport::Request;

  if (m_collecting_batch)
  {
    if (const auto req = std::get_if<Request>(&msg.m_body))
    {
      m_batch.emplace_back(std::move(*req));
      err_code->clear();
      return;
    }
    // else: Anything else must not overtake the requests before it.
    flush_batch_locked(err_code);
    if (*err_code)
    {
      return;
    }
  }

  m_channel->send(msg, err_code);
} // Requester::send_locked()

void Requester::flush_batch_locked(Error_code* err_code)
{
  using transport::Envelope;
  using transport::Batch;

  err_code->clear();
  if (m_batch.empty())
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Requester [" << m_id << "]: Sending batch of [" << m_batch.size() << "] requests.");

  Envelope msg{ m_id, Batch{ std::move(m_batch) } };
  m_batch.clear();
  m_channel->send(msg, err_code);
  if (*err_code)
  {
    // Fail the ones that wanted a response; the others are simply lost (logged).
    const auto& reqs = std::get<Batch>(msg.m_body).m_requests;
    FLOW_LOG_WARNING("Requester [" << m_id << "]: Batch of [" << reqs.size() << "] requests could not be sent: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    for (const auto& req : reqs)
    {
      const auto it = m_pending.find(req.m_request_id);
      if (it != m_pending.end())
      {
        it->second->set_value(Call_result{ transport::Value(), *err_code });
        m_pending.erase(it);
      }
    }
  }
} // Requester::flush_batch_locked()

void Requester::cancel_all()
{
  FLOW_LOG_INFO("Requester [" << m_id << "]: Canceling [" << n_pending() << "] pending calls on user request.");
  fail_pending(error::Code::S_REQUEST_CANCELED);
}

void Requester::fail_pending(const Error_code& err_code)
{
  decltype(m_pending) pending;
  {
    Lock_guard lock(m_mutex);
    pending.swap(m_pending);
  }

  for (const auto& id_and_promise : pending)
  {
    id_and_promise.second->set_value(Call_result{ transport::Value(), err_code });
  }
}

void Requester::on_msg(transport::Envelope&& msg)
{
  using transport::Bootstrap;
  using transport::Reply;
  using transport::Frame_begin;

  // We are in thread W.

  if (msg.m_requester_id != m_id)
  {
    FLOW_LOG_WARNING("Requester [" << m_id << "]: Received message [" << msg << "] addressed to another requester.  "
                     "Dropping it.");
    return;
  }
  // else

  if (auto bootstrap = std::get_if<Bootstrap>(&msg.m_body))
  {
    on_bootstrap(std::move(*bootstrap));
  }
  else if (auto reply = std::get_if<Reply>(&msg.m_body))
  {
    on_reply(std::move(*reply));
  }
  else if (const auto frame_begin = std::get_if<Frame_begin>(&msg.m_body))
  {
    const auto time_ms = frame_begin->m_time_ms;
    m_user_loop.post([this, time_ms]() { run_frame(time_ms); });
  }
  else
  {
    FLOW_LOG_WARNING("Requester [" << m_id << "]: Received message [" << msg << "] that only a requester may send: "
                     "[" << Error_code(error::Code::S_PROTOCOL_UNEXPECTED_MESSAGE).message() << "].  Dropping it.");
  }
} // Requester::on_msg()

void Requester::on_bootstrap(transport::Bootstrap&& bootstrap)
{
  {
    Lock_guard lock(m_mutex);
    if (m_bootstrapped)
    {
      FLOW_LOG_WARNING("Requester [" << m_id << "]: Received second bootstrap.  Dropping it.");
      return;
    }
    // else

    m_operation_names.insert(bootstrap.m_operation_names.begin(), bootstrap.m_operation_names.end());
    m_constants = std::move(bootstrap.m_constants);
    m_bootstrapped = true;

    FLOW_LOG_INFO("Requester [" << m_id << "]: Bootstrapped: [" << m_operation_names.size() << "] operations, "
                  "[" << m_constants.size() << "] constants.");
  }

  m_user_loop.post([this]() { m_on_bootstrap_func(); });
}

void Requester::on_reply(transport::Reply&& reply)
{
  Promise_ptr promise_ptr;
  {
    Lock_guard lock(m_mutex);
    const auto it = m_pending.find(reply.m_request_id);
    if (it == m_pending.end())
    {
      FLOW_LOG_WARNING("Requester [" << m_id << "]: Received reply to request [" << reply.m_request_id << "] which "
                       "is not pending (canceled?).  Dropping it.");
      return;
    }
    // else
    promise_ptr = std::move(it->second);
    m_pending.erase(it);
  }

  promise_ptr->set_value(Call_result{ std::move(reply.m_result), reply.m_err_code });
}

void Requester::run_frame(uint64_t time_ms)
{
  using transport::Envelope;
  using transport::Frame_end;

  // We are in thread U.

  FLOW_LOG_TRACE("Requester [" << m_id << "]: Frame [" << time_ms << "ms] begins; invoking frame handler.");
  {
    Lock_guard lock(m_mutex);
    m_collecting_batch = m_config.m_batch_frame_calls;
  }

  m_on_frame_func(time_ms);

  Lock_guard lock(m_mutex);
  Error_code err_code;
  flush_batch_locked(&err_code);
  m_collecting_batch = false;
  if (!err_code)
  {
    m_channel->send(Envelope{ m_id, Frame_end() }, &err_code);
  }
  if (err_code)
  {
    FLOW_LOG_WARNING("Requester [" << m_id << "]: Could not complete frame [" << time_ms << "ms]: "
                     "[" << err_code << "] [" << err_code.message() << "].");
    return;
  }
  // else
  FLOW_LOG_TRACE("Requester [" << m_id << "]: Frame [" << time_ms << "ms] ended.");
} // Requester::run_frame()

bool Requester::bootstrapped() const
{
  Lock_guard lock(m_mutex);
  return m_bootstrapped;
}

std::vector<std::string> Requester::operation_names() const
{
  Lock_guard lock(m_mutex);
  return std::vector<std::string>(m_operation_names.begin(), m_operation_names.end());
}

size_t Requester::n_pending() const
{
  Lock_guard lock(m_mutex);
  return m_pending.size();
}

transport::requester_id_t Requester::id() const
{
  return m_id;
}

} // namespace glproxy::requester
