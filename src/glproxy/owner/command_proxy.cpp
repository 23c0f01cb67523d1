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
#include "glproxy/owner/command_proxy.hpp"
#include <flow/error/error.hpp>
#include <boost/chrono/system_clocks.hpp>
#include <boost/make_shared.hpp>
#include <boost/system/system_error.hpp>
#include <cassert>

namespace glproxy::owner
{

Command_proxy::Command_proxy(flow::log::Logger* logger_ptr, transport::requester_id_t requester_id,
                             const Operation_table& operations, Send_func&& send_func, const Proxy_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_OWNER),
  m_requester_id(requester_id),
  m_operations(operations),
  m_send_func(std::move(send_func)),
  m_config(config),
  m_buffering(false),
  m_n_frame_ends_owed(0)
{
  assert((m_requester_id != 0) && "Requester ID 0 is a sentinel.");
  FLOW_LOG_INFO("Command_proxy [" << m_requester_id << "]: Created; mode-setter [" << m_config.m_mode_setter_name
                << "]; [" << m_config.m_targeted_setter_names.size() << "] targeted setters; "
                "[" << m_config.m_suppressed_names.size() << "] suppressed operations.");
}

void Command_proxy::send_bootstrap(Error_code* err_code)
{
  using transport::Envelope;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send_bootstrap(actual_err_code); },
         err_code, "glproxy::owner::Command_proxy::send_bootstrap()"))
  {
    return;
  }
  // If got here: err_code is not null.

  auto bootstrap = m_operations.to_bootstrap();
  FLOW_LOG_INFO("Command_proxy [" << m_requester_id << "]: Sending bootstrap: "
                "[" << bootstrap.m_operation_names.size() << "] operations, "
                "[" << bootstrap.m_constants.size() << "] constants.");
  m_send_func(Envelope{ m_requester_id, std::move(bootstrap) }, err_code);
}

void Command_proxy::dispatch(transport::Envelope&& msg)
{
  using transport::Request;
  using transport::Batch;
  using transport::Frame_end;
  using transport::Release;

  if (msg.m_requester_id != m_requester_id)
  {
    FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Ignoring message [" << msg << "] addressed to "
                   "another requester.");
    return;
  }
  // else

  if (std::holds_alternative<Frame_end>(msg.m_body))
  {
    if (m_n_frame_ends_owed != 0)
    {
      --m_n_frame_ends_owed;
      FLOW_LOG_INFO("Command_proxy [" << m_requester_id << "]: Late frame end of an abandoned frame received; "
                    "[" << m_n_frame_ends_owed << "] more owed.  Ignoring it.");
      return;
    }
    // else
    if (!m_frame_end_promise)
    {
      FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Frame end received, but no frame is being "
                       "collected (late, after a timeout?).  Ignoring.");
      return;
    }
    // else

    FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Frame end received; [" << m_queue.size() << "] "
                   "items queued.");
    const auto promise_ptr = std::move(m_frame_end_promise);
    m_frame_end_promise.reset();
    promise_ptr->set_value();
    return;
  }
  // else

  if (const auto release_msg = std::get_if<Release>(&msg.m_body))
  {
    if (m_buffering)
    {
      m_queue.push_back(Queued{ *release_msg, false });
      return;
    }
    // else
    release(*release_msg);
    return;
  }
  // else

  std::vector<Request> reqs;
  if (auto req = std::get_if<Request>(&msg.m_body))
  {
    reqs.push_back(std::move(*req));
  }
  else if (auto batch = std::get_if<Batch>(&msg.m_body))
  {
    reqs = std::move(batch->m_requests);
  }
  else
  {
    FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Received message [" << msg << "] that only the "
                     "owner may send: [" << Error_code(error::Code::S_PROTOCOL_UNEXPECTED_MESSAGE).message() << "].  "
                     "Dropping it.");
    return;
  }

  for (const auto& req : reqs)
  {
    if (!well_formed(req))
    {
      FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Received message with malformed request "
                       "[" << req << "]: [" << Error_code(error::Code::S_PROTOCOL_MALFORMED_MESSAGE).message() << "].  "
                       "Dropping the whole message ([" << reqs.size() << "] requests).");
      return;
    }
  }
  // else

  if (m_n_frame_ends_owed != 0)
  {
    FLOW_LOG_INFO("Command_proxy [" << m_requester_id << "]: Received [" << reqs.size() << "] requests of an "
                  "abandoned frame.  Canceling them.");
    for (const auto& req : reqs)
    {
      cancel(req);
    }
    return;
  }
  // else

  for (auto& req : reqs)
  {
    if (m_buffering)
    {
      FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Queuing [" << req << "].");
      m_queue.push_back(Queued{ std::move(req), false });
    }
    else
    {
      execute_and_reply(req, false);
    }
  }
} // Command_proxy::dispatch()

Command_proxy::Frame_end_future Command_proxy::begin_frame_collection(Error_code* err_code)
{
  using transport::Envelope;
  using transport::Frame_begin;
  using boost::chrono::system_clock;
  using boost::chrono::duration_cast;
  using boost::chrono::milliseconds;

  Frame_end_future future;
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { future = begin_frame_collection(actual_err_code); },
         err_code, "glproxy::owner::Command_proxy::begin_frame_collection()"))
  {
    return future;
  }
  // If got here: err_code is not null.

  if (m_frame_end_promise)
  {
    FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Cannot begin frame collection: the previous one "
                     "is still awaiting frame end.  Emitting error.");
    *err_code = error::Code::S_FRAME_COLLECTION_IN_PROGRESS;
    return future;
  }
  // else

  const uint64_t time_ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  m_send_func(Envelope{ m_requester_id, Frame_begin{ time_ms } }, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Cannot begin frame collection: sending frame begin "
                     "failed: [" << *err_code << "] [" << err_code->message() << "].");
    return future;
  }
  // else

  /* Seed the window with the sticky state so that, at flush, it is re-established before anything else of ours,
   * whatever other requesters did to the resource meanwhile.  Front of queue: if somehow something is queued
   * already, it is of this window too. */
  const auto replays = m_sticky_state.replay_list();
  for (auto it = replays.rbegin(); it != replays.rend(); ++it)
  {
    m_queue.push_front(Queued{ *it, true });
  }

  m_buffering = true;
  m_frame_end_promise = boost::make_shared<boost::promise<void>>();
  future = m_frame_end_promise->get_future();

  FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Collecting frame [" << time_ms << "ms]; seeded "
                 "[" << replays.size() << "] sticky-state replays.");
  return future;
} // Command_proxy::begin_frame_collection()

void Command_proxy::flush()
{
  using transport::Request;
  using transport::Release;

  m_buffering = false;

  decltype(m_queue) queue;
  queue.swap(m_queue);

  FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Flushing [" << queue.size() << "] queued items.");

  for (const auto& queued : queue)
  {
    if (const auto req = std::get_if<Request>(&queued.m_item))
    {
      execute_and_reply(*req, queued.m_replay);
    }
    else
    {
      release(std::get<Release>(queued.m_item));
    }
  }
}

void Command_proxy::discard()
{
  FLOW_LOG_INFO("Command_proxy [" << m_requester_id << "]: Discarding [" << m_queue.size() << "] queued requests "
                "unexecuted" << (m_frame_end_promise ? "; abandoning frame-end waiter" : "") << '.');

  m_buffering = false;

  // Requests go, each answered as canceled if it wanted an answer; releases are honored regardless.
  decltype(m_queue) queue;
  queue.swap(m_queue);
  for (const auto& queued : queue)
  {
    if (const auto release_msg = std::get_if<transport::Release>(&queued.m_item))
    {
      release(*release_msg);
    }
    else if (!queued.m_replay)
    {
      cancel(std::get<transport::Request>(queued.m_item));
    }
  }

  if (m_frame_end_promise)
  {
    ++m_n_frame_ends_owed;
    m_frame_end_promise.reset();
  }
}

std::optional<transport::Value> Command_proxy::execute(const transport::Request& req, bool replay,
                                                       Error_code* err_code)
{
  using transport::Value;
  using transport::Value_list;
  using transport::Handle_ref;
  using transport::Object_ptr;

  err_code->clear();

  const auto op = m_operations.find(req.m_name);
  if (!op)
  {
    FLOW_LOG_INFO("Command_proxy [" << m_requester_id << "]: Operation [" << req.m_name << "] is not supported "
                  "by the resource; ignoring [" << req << "].");
    return std::nullopt;
  }
  if (m_config.m_suppressed_names.count(req.m_name) != 0)
  {
    FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Operation [" << req.m_name << "] is suppressed; "
                   "ignoring [" << req << "].");
    return std::nullopt;
  }
  // else

  Value_list args;
  args.reserve(req.m_args.size());
  for (const auto& arg : req.m_args)
  {
    if (const auto handle = std::get_if<Handle_ref>(&arg))
    {
      auto obj = m_handles.resolve(handle->m_handle_id);
      if (!obj)
      {
        FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Request [" << req << "] refers to "
                         "[" << *handle << "] which is unknown or released.  Failing it.");
        *err_code = error::Code::S_DANGLING_HANDLE_REFERENCE;
        return Value();
      }
      // else
      args.push_back(transport::to_value(std::move(obj)));
    }
    else
    {
      args.push_back(arg);
    }
  } // for (arg : req.m_args)

  FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Executing [" << req << "]"
                 << (replay ? " (sticky-state replay)" : "") << '.');

  Value result;
  try
  {
    result = (*op)(args);
  }
  catch (const boost::system::system_error& exc)
  {
    const bool ours = exc.code().category() == Error_code(error::Code::S_OPERATION_FAILED).category();
    *err_code = ours ? exc.code() : Error_code(error::Code::S_OPERATION_FAILED);
    FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Operation of [" << req << "] failed: "
                     "[" << exc.what() << "].  Reporting [" << *err_code << "].");
    return Value();
  }
  catch (const std::exception& exc)
  {
    *err_code = error::Code::S_OPERATION_FAILED;
    FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Operation of [" << req << "] failed: "
                     "[" << exc.what() << "].");
    return Value();
  }

  // Only a setter that took effect is sticky.
  if (!replay)
  {
    if (req.m_name == m_config.m_mode_setter_name)
    {
      m_sticky_state.record_mode_setter(req);
    }
    else if ((m_config.m_targeted_setter_names.count(req.m_name) != 0)
             && (!m_sticky_state.record_targeted_setter(req)))
    {
      FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Setter [" << req << "] names a NaN target; "
                       "it will not be replayed.");
    }
  }

  if (const auto obj = std::get_if<Object_ptr>(&result))
  {
    if (!*obj)
    {
      return Value(); // Null object: as good as none.
    }
    // else: Never to be sent raw.
    const auto handle = m_handles.insert(*obj);
    FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Result [" << result << "] stored as [" << handle << "].");
    return transport::to_value(handle);
  }
  // else

  if (transport::is_primitive(result) && (!std::holds_alternative<std::monostate>(result)))
  {
    m_result_trace.record(req.m_name, req.m_args, result);
  }
  return result;
} // Command_proxy::execute()

void Command_proxy::execute_and_reply(const transport::Request& req, bool replay)
{
  using transport::Envelope;
  using transport::Reply;

  Error_code err_code;
  auto result = execute(req, replay, &err_code);
  if ((!result) || replay || (!req.m_wants_response))
  {
    return;
  }
  // else

  send_or_log(Envelope{ m_requester_id, Reply{ req.m_request_id, std::move(*result), err_code } });
}

void Command_proxy::release(const transport::Release& release)
{
  if (m_handles.release(release.m_handle_id))
  {
    FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Released handle#" << release.m_handle_id << "; "
                   "[" << m_handles.size() << "] remain.");
    return;
  }
  // else
  FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Release of handle#" << release.m_handle_id << " which "
                   "is unknown or already released.  Ignoring.");
}

void Command_proxy::cancel(const transport::Request& req)
{
  using transport::Envelope;
  using transport::Reply;

  FLOW_LOG_TRACE("Command_proxy [" << m_requester_id << "]: Canceling [" << req << "].");
  if (req.m_wants_response)
  {
    send_or_log(Envelope{ m_requester_id, Reply{ req.m_request_id, transport::Value(),
                                                 error::Code::S_REQUEST_CANCELED } });
  }
}

void Command_proxy::send_or_log(const transport::Envelope& msg)
{
  Error_code err_code;
  m_send_func(msg, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Command_proxy [" << m_requester_id << "]: Could not send [" << msg << "]: "
                     "[" << err_code << "] [" << err_code.message() << "].");
  }
}

bool Command_proxy::well_formed(const transport::Request& req) // Static.
{
  return (req.m_request_id != 0) && (!req.m_name.empty());
}

transport::requester_id_t Command_proxy::requester_id() const
{
  return m_requester_id;
}

bool Command_proxy::buffering() const
{
  return m_buffering;
}

size_t Command_proxy::n_queued() const
{
  return m_queue.size();
}

const Handle_registry& Command_proxy::handles() const
{
  return m_handles;
}

const Sticky_state_cache& Command_proxy::sticky_state() const
{
  return m_sticky_state;
}

const Result_trace& Command_proxy::result_trace() const
{
  return m_result_trace;
}

} // namespace glproxy::owner
