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
#include "glproxy/owner/frame_coordinator.hpp"
#include <flow/error/error.hpp>
#include <cassert>

namespace glproxy::owner
{

Frame_coordinator::Frame_coordinator(flow::log::Logger* logger_ptr, const Operation_table& operations,
                                     Present_func&& present_func, const Coordinator_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_OWNER),
  m_operations(operations),
  m_present_func(std::move(present_func)),
  m_config(config),
  m_owner_loop(get_logger(), "owner")
{
  m_owner_loop.start();
  FLOW_LOG_INFO("Frame_coordinator [" << this << "]: Started owner thread; warm-up frames "
                "[" << m_config.m_n_warm_up_frames << "]; frame-end timeout "
                "[" << ((m_config.m_frame_end_timeout == Fine_duration::max())
                          ? std::string("none")
                          : std::to_string(m_config.m_frame_end_timeout.count()) + "ns") << "].");
}

Frame_coordinator::~Frame_coordinator()
{
  FLOW_LOG_INFO("Frame_coordinator [" << this << "]: Shutting down; [" << m_requesters.size() << "] requesters.");

  // No owner-thread task runs after this; hence tasks posted by channels' handlers from now on are no-ops.
  m_owner_loop.stop();
  // Now we are the only thread touching m_requesters.  Each channel's thread stops as it is destroyed.
  m_requesters.clear();
}

void Frame_coordinator::add_requester(transport::requester_id_t requester_id,
                                      transport::Msg_channel::Link_ptr&& link, Error_code* err_code)
{
  using flow::async::Synchronicity;
  using transport::Msg_channel;
  using transport::Envelope;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { add_requester(requester_id, std::move(link), actual_err_code); },
         err_code, "glproxy::owner::Frame_coordinator::add_requester()"))
  {
    return;
  }
  // If got here: err_code is not null.

  assert((requester_id != 0) && "Requester ID 0 is a sentinel.");

  bool duplicate = false;
  m_owner_loop.post([&]()
  {
    // We are in thread O.
    if (proxy_or_null(requester_id))
    {
      duplicate = true;
      return;
    }
    // else

    Requester_state state;
    state.m_requester_id = requester_id;
    state.m_channel.reset(new Msg_channel(get_logger(), std::move(link), m_config.m_codec_config));

    auto channel = state.m_channel.get(); // Lives as long as the proxy that uses it.
    state.m_proxy.reset(new Command_proxy(get_logger(), requester_id, m_operations,
                                          [channel](const Envelope& msg, Error_code* send_err_code)
    {
      channel->send(msg, send_err_code);
    }, m_config.m_proxy_config));

    /* Handlers run in the channel's thread.  Hand each message to thread O, finding the proxy by ID there: by then
     * the requester may well have been removed. */
    state.m_channel->start([this, requester_id](Envelope&& msg)
    {
      m_owner_loop.post([this, requester_id, msg = std::move(msg)]() mutable
      {
        const auto proxy = proxy_or_null(requester_id);
        if (!proxy)
        {
          FLOW_LOG_TRACE("Frame_coordinator [" << this << "]: Message [" << msg << "] arrived from removed "
                         "requester [" << requester_id << "].  Ignoring.");
          return;
        }
        // else
        proxy->dispatch(std::move(msg));
      });
    },
                           [this, requester_id](const Error_code& link_err_code)
    {
      FLOW_LOG_WARNING("Frame_coordinator [" << this << "]: Link to requester [" << requester_id << "] broke: "
                       "[" << link_err_code << "] [" << link_err_code.message() << "].  Its frames shall fault "
                       "from now on.");
    });

    state.m_proxy->send_bootstrap(err_code);
    m_requesters.push_back(std::move(state));
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  if (duplicate)
  {
    // The requester already added keeps running; `link` is left untouched.
    FLOW_LOG_WARNING("Frame_coordinator [" << this << "]: Requester [" << requester_id << "] was already added.  "
                     "Not adding it again.");
    *err_code = error::Code::S_DUPLICATE_REQUESTER_ID;
    return;
  }
  // else

  if (*err_code)
  {
    FLOW_LOG_WARNING("Frame_coordinator [" << this << "]: Could not bootstrap requester [" << requester_id << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].  Not adding it.");
    m_owner_loop.post([&]() { remove_requester(requester_id); },
                      Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
    return;
  }
  // else

  FLOW_LOG_INFO("Frame_coordinator [" << this << "]: Bootstrapped requester [" << requester_id << "]; running "
                "[" << m_config.m_n_warm_up_frames << "] warm-up frames for it.");

  // Warm-up: the requester's frames alone; no present (it must not disturb what others see).
  for (size_t frame_idx = 0; frame_idx != m_config.m_n_warm_up_frames; ++frame_idx)
  {
    Future_map futures;
    Fault_map faults;

    m_owner_loop.post([&]()
    {
      Error_code begin_err_code;
      auto future = proxy_or_null(requester_id)->begin_frame_collection(&begin_err_code);
      if (begin_err_code)
      {
        faults[requester_id] = begin_err_code;
      }
      else
      {
        futures.emplace(requester_id, std::move(future));
      }
    }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

    await_frame_ends(&futures, &faults);

    m_owner_loop.post([&]()
    {
      const auto proxy = proxy_or_null(requester_id);
      if (faults.empty())
      {
        proxy->flush();
      }
      else
      {
        proxy->discard();
        remove_requester(requester_id);
      }
    }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

    if (!faults.empty())
    {
      *err_code = faults.begin()->second;
      FLOW_LOG_WARNING("Frame_coordinator [" << this << "]: Warm-up frame [" << frame_idx << "] of requester "
                       "[" << requester_id << "] failed: [" << *err_code << "] [" << err_code->message() << "].  "
                       "Not adding it.");
      return;
    }
  } // for (frame_idx)

  FLOW_LOG_INFO("Frame_coordinator [" << this << "]: Requester [" << requester_id << "] joined the frame cycle; "
                "[" << n_requesters() << "] requesters now.");
} // Frame_coordinator::add_requester()

Frame_coordinator::Fault_map Frame_coordinator::run_frame()
{
  using flow::async::Synchronicity;

  Future_map futures;
  Fault_map faults;

  // Open every requester's window first, so they all issue their frame concurrently.
  m_owner_loop.post([&]()
  {
    for (const auto& state : m_requesters)
    {
      Error_code begin_err_code;
      auto future = state.m_proxy->begin_frame_collection(&begin_err_code);
      if (begin_err_code)
      {
        faults[state.m_requester_id] = begin_err_code;
      }
      else
      {
        futures.emplace(state.m_requester_id, std::move(future));
      }
    }
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  await_frame_ends(&futures, &faults);

  m_owner_loop.post([&]()
  {
    m_present_func();

    // Whole batches, one requester after another, in the order they were added.
    for (const auto& state : m_requesters)
    {
      if (faults.count(state.m_requester_id) == 0)
      {
        state.m_proxy->flush();
      }
      else
      {
        state.m_proxy->discard();
      }
    }
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  if (!faults.empty())
  {
    FLOW_LOG_WARNING("Frame_coordinator [" << this << "]: Frame done with [" << faults.size() << "] of "
                     "[" << m_requesters.size() << "] requesters faulted; their frames were discarded.");
  }
  else
  {
    FLOW_LOG_TRACE("Frame_coordinator [" << this << "]: Frame done for [" << m_requesters.size() << "] "
                   "requesters.");
  }
  return faults;
} // Frame_coordinator::run_frame()

Frame_coordinator::Fault_map Frame_coordinator::run_frames(size_t n_frames)
{
  Fault_map all_faults;
  for (size_t frame_idx = 0; frame_idx != n_frames; ++frame_idx)
  {
    for (const auto& fault : run_frame())
    {
      all_faults[fault.first] = fault.second;
    }
  }
  return all_faults;
}

void Frame_coordinator::await_frame_ends(Future_map* futures, Fault_map* faults)
{
  using flow::Fine_clock;

  const bool no_timeout = m_config.m_frame_end_timeout == Fine_duration::max();
  const auto deadline = no_timeout ? Fine_clock::time_point::max()
                                   : (Fine_clock::now() + m_config.m_frame_end_timeout);

  for (auto& id_and_future : *futures)
  {
    auto& future = id_and_future.second;
    if (no_timeout)
    {
      future.wait();
      continue;
    }
    // else

    const auto now = Fine_clock::now();
    const auto remaining = (now < deadline) ? Fine_duration(deadline - now) : Fine_duration::zero();
    if (future.wait_for(remaining) != boost::future_status::ready)
    {
      FLOW_LOG_WARNING("Frame_coordinator [" << this << "]: Requester [" << id_and_future.first << "] did not end "
                       "its frame in time.  Faulting it for this frame.");
      (*faults)[id_and_future.first] = error::Code::S_PEER_UNRESPONSIVE;
    }
  }
}

void Frame_coordinator::exec_in_owner_thread(const Function<void ()>& task)
{
  Function<void ()> task_copy(task);
  m_owner_loop.post(std::move(task_copy), flow::async::Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);
}

const Command_proxy* Frame_coordinator::proxy(transport::requester_id_t requester_id) const
{
  return proxy_or_null(requester_id);
}

size_t Frame_coordinator::n_requesters() const
{
  return m_requesters.size();
}

Command_proxy* Frame_coordinator::proxy_or_null(transport::requester_id_t requester_id) const
{
  for (const auto& state : m_requesters)
  {
    if (state.m_requester_id == requester_id)
    {
      return state.m_proxy.get();
    }
  }
  return nullptr;
}

void Frame_coordinator::remove_requester(transport::requester_id_t requester_id)
{
  for (auto it = m_requesters.begin(); it != m_requesters.end(); ++it)
  {
    if (it->m_requester_id == requester_id)
    {
      FLOW_LOG_INFO("Frame_coordinator [" << this << "]: Removing requester [" << requester_id << "].");
      m_requesters.erase(it);
      return;
    }
  }
}

} // namespace glproxy::owner
