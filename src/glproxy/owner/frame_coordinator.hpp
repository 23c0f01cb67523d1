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
#pragma once

#include "glproxy/owner/command_proxy.hpp"
#include "glproxy/transport/msg_channel.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <map>

namespace glproxy::owner
{

// Types.

/// Settings for Frame_coordinator.
struct Coordinator_config
{
  // Data.

  /// Frames run for a newly added requester alone (collect, flush; no present) before it joins the cycle.
  size_t m_n_warm_up_frames = 3;

  /// How long a frame waits for each requester's frame end; `Fine_duration::max()` means no limit.
  Fine_duration m_frame_end_timeout = Fine_duration::max();

  /// Given to each Command_proxy.
  Proxy_config m_proxy_config;

  /// Given to each requester's transport::Msg_channel.
  transport::Codec_config m_codec_config;
};

/**
 * Owner-context driver: owns the owner thread (thread O), one Command_proxy plus transport::Msg_channel per
 * requester, and runs the frame cycle across them.
 *
 * All resource access happens in thread O: every Command_proxy method, hence every operation, and the present
 * function.  Inbound messages arrive in each channel's own thread and are handed to thread O, where
 * Command_proxy::dispatch() routes them.
 *
 * ### Frame cycle (run_frame()) ###
 *   -# In thread O: every proxy begins frame collection (sending Frame_begin).
 *   -# Await every proxy's frame end, concurrently, bounded by Coordinator_config::m_frame_end_timeout.
 *   -# In thread O: the present function runs, exactly once; then every proxy flushes, in the order the
 *      requesters were added.  A proxy whose frame end did not come in time (or could not even begin) is
 *      discarded instead and reported as faulted; the others flush regardless.
 *
 * Thus batches from different requesters never interleave, and the resource is presented/reset before any
 * requester's commands of the new frame apply.
 *
 * ### Thread safety ###
 * add_requester(), run_frame(), and run_frames() must not be invoked concurrently with each other.
 * exec_in_owner_thread() may be invoked at any time.  None of them may be invoked from thread O.
 */
class Frame_coordinator :
  public flow::log::Log_context
{
public:
  // Types.

  /// Presents/resets the resource once per frame, in thread O, before the flushes.
  using Present_func = Function<void ()>;

  /// Per-requester faults of a frame (or frames).
  using Fault_map = std::map<transport::requester_id_t, Error_code>;

  // Constructors/destructor.

  /**
   * Constructs the coordinator with no requesters; starts thread O.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param operations
   *        The resource; must outlive `*this`.  Touched only in thread O from now on.
   * @param present_func
   *        See Present_func.
   * @param config
   *        See Coordinator_config.
   */
  explicit Frame_coordinator(flow::log::Logger* logger_ptr, const Operation_table& operations,
                             Present_func&& present_func, const Coordinator_config& config = Coordinator_config());

  /// Stops thread O, then closes every channel.
  ~Frame_coordinator();

  // Methods.

  /**
   * Adds a requester: creates its proxy and channel, sends Bootstrap, then runs the warm-up frames for it alone.
   * Blocks until that is done.  On error the requester is not added.
   *
   * @param requester_id
   *        Requester ID; not 0.
   * @param link
   *        Link to the requester; not yet started.  Not moved from if the ID was already added.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        those of transport::Msg_channel::send() (bootstrap or frame begin not sent);
   *        error::Code::S_PEER_UNRESPONSIVE (warm-up frame end not in time);
   *        error::Code::S_DUPLICATE_REQUESTER_ID (`requester_id` already added).
   */
  void add_requester(transport::requester_id_t requester_id, transport::Msg_channel::Link_ptr&& link,
                     Error_code* err_code = 0);

  /**
   * Runs one frame cycle; see class doc header.  Blocks until done.
   *
   * @return Faulted requesters of this frame: error::Code::S_PEER_UNRESPONSIVE, or whatever prevented the frame
   *         from beginning for that requester (e.g., error::Code::S_LINK_CLOSED).  Empty if all went well.
   */
  Fault_map run_frame();

  /**
   * Runs run_frame() the given number of times.
   *
   * @param n_frames
   *        Count.
   * @return Union of the faults; for a requester faulted more than once, the latest fault.
   */
  Fault_map run_frames(size_t n_frames);

  /**
   * Runs the given task in thread O, blocking until it completes.  E.g., to inspect the resource or
   * a proxy consistently.
   *
   * @param task
   *        Task.
   */
  void exec_in_owner_thread(const Function<void ()>& task);

  /**
   * The proxy of the given requester.  Access it only from thread O (exec_in_owner_thread()).
   *
   * @param requester_id
   *        Requester ID.
   * @return Null if no such requester.
   */
  const Command_proxy* proxy(transport::requester_id_t requester_id) const;

  /**
   * Number of requesters added.
   * @return See above.
   */
  size_t n_requesters() const;

private:
  // Types.

  /// One requester's owner-side state.
  struct Requester_state
  {
    // Data.

    /// Requester ID.
    transport::requester_id_t m_requester_id;

    /// Channel to it.
    boost::movelib::unique_ptr<transport::Msg_channel> m_channel;

    /// Its proxy.
    boost::movelib::unique_ptr<Command_proxy> m_proxy;
  };

  /// Frame-end futures of a frame being collected, by requester ID.
  using Future_map = std::map<transport::requester_id_t, Command_proxy::Frame_end_future>;

  // Methods.

  /**
   * Awaits every future until the shared deadline; moves each requester that missed it into `*faults`.
   *
   * @param futures
   *        Futures.
   * @param faults
   *        Faults go here.
   */
  void await_frame_ends(Future_map* futures, Fault_map* faults);

  /**
   * In thread O: the proxy of the given requester.
   *
   * @param requester_id
   *        Requester ID.
   * @return Null if none.
   */
  Command_proxy* proxy_or_null(transport::requester_id_t requester_id) const;

  /**
   * In thread O: removes the given requester (closing its channel).
   *
   * @param requester_id
   *        Requester ID.
   */
  void remove_requester(transport::requester_id_t requester_id);

  // Data.

  /// See ctor.
  const Operation_table& m_operations;

  /// See ctor.
  Present_func m_present_func;

  /// See ctor.
  const Coordinator_config m_config;

  /// Requesters in the order added.  Modified only in thread O.
  std::vector<Requester_state> m_requesters;

  /// Thread O.
  flow::async::Single_thread_task_loop m_owner_loop;
}; // class Frame_coordinator

} // namespace glproxy::owner
