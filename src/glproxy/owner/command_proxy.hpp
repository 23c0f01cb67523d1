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

#include "glproxy/owner/operation_table.hpp"
#include "glproxy/owner/handle_registry.hpp"
#include "glproxy/owner/sticky_state_cache.hpp"
#include "glproxy/owner/result_trace.hpp"
#include <flow/log/log.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/future.hpp>
#include <deque>
#include <optional>
#include <set>

namespace glproxy::owner
{

// Types.

/// Fixed policy of a Command_proxy: which operations are sticky state setters, which are suppressed.
struct Proxy_config
{
  // Data.

  /// The mode-setter operation: only its most recent request is replayed each frame.
  std::string m_mode_setter_name = "useProgram";

  /// Targeted state setters: the most recent request per (name, first argument) is replayed each frame.
  std::set<std::string> m_targeted_setter_names = { "bindBuffer", "bindFramebuffer", "bindRenderbuffer",
                                                    "bindTexture" };

  /// Operations the owner performs itself once per frame; requesters' requests for them are ignored.
  std::set<std::string> m_suppressed_names = { "clear" };
};

/**
 * Owner-side agent of one requester: receives that requester's messages, and executes its requests against
 * the shared resource (Operation_table) either at once or, while a frame is being collected, deferred until
 * flush().
 *
 * ### Frame cycle ###
 *   - begin_frame_collection(): buffering starts; the queue is seeded with replays of the sticky state
 *     (Sticky_state_cache); Frame_begin is sent to the requester; the returned future resolves when the
 *     requester's Frame_end arrives.
 *   - Meanwhile requests (singly or in batches) and releases are queued, in arrival order; nothing executes.
 *   - flush(): buffering stops; the queue executes in order; requests that wanted a response are answered.
 *     Or discard(): buffering stops; queued requests are dropped unexecuted, those wanting a response
 *     answered with error::Code::S_REQUEST_CANCELED (queued releases still apply).
 *
 * If discard() abandons a frame whose Frame_end has not arrived, that Frame_end is still owed: it is swallowed when
 * it does arrive, and any requests arriving before it (the rest of the abandoned frame) are dropped, those wanting
 * a response answered with error::Code::S_REQUEST_CANCELED.  A slow requester thus rejoins cleanly.
 *
 * ### Execution of one request ###
 * Handle references among the arguments are resolved (a stale one fails the request with
 * error::Code::S_DANGLING_HANDLE_REFERENCE, touching nothing).  An unknown or suppressed operation is ignored
 * entirely: no reply, no trace.  The operation runs; a sticky setter that ran without failing is recorded.  A
 * primitive result is traced and returned as-is; an object result is stored in the Handle_registry and a handle
 * returned in its place.  A reply is sent if wanted (and the request is not a sticky-state replay).
 *
 * ### Thread safety ###
 * None: every method must be invoked from one thread at a time (the owner thread, see Frame_coordinator).
 * Messages are sent via the send function given to the ctor, from within these methods.
 */
class Command_proxy :
  public flow::log::Log_context
{
public:
  // Types.

  /// Sends a message to the requester.  Must not block for long.
  using Send_func = Function<void (const transport::Envelope& msg, Error_code* err_code)>;

  /// Resolves when the requester ends the frame being collected.
  using Frame_end_future = boost::unique_future<void>;

  // Constructors/destructor.

  /**
   * Constructs the proxy.  Sends nothing yet (see send_bootstrap()).
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param requester_id
   *        The requester served; not 0.
   * @param operations
   *        The resource; must outlive `*this`.
   * @param send_func
   *        Sends messages to the requester.
   * @param config
   *        See Proxy_config.
   */
  explicit Command_proxy(flow::log::Logger* logger_ptr, transport::requester_id_t requester_id,
                         const Operation_table& operations, Send_func&& send_func,
                         const Proxy_config& config = Proxy_config());

  // Methods.

  /**
   * Sends Bootstrap (operation names and constants) to the requester.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        those of the send function.
   */
  void send_bootstrap(Error_code* err_code = 0);

  /**
   * Handles a message received from (supposedly) the requester.  Anything addressed to another requester is
   * ignored.  Frame_end resolves the frame-end future.  Requests, batches, releases are queued while buffering,
   * else executed at once.  Malformed or wrong-direction messages are logged and dropped whole.
   *
   * @param msg
   *        Message.
   */
  void dispatch(transport::Envelope&& msg);

  /**
   * Starts collecting a frame; see class doc header.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_FRAME_COLLECTION_IN_PROGRESS (a frame-end future is already outstanding);
   *        those of the send function (in which case nothing changes).
   * @return Future; not valid on error.
   */
  Frame_end_future begin_frame_collection(Error_code* err_code = 0);

  /// Stops buffering; executes the queue in order, replying as due.  Leaves any frame-end future alone.
  void flush();

  /// Stops buffering; cancels queued requests unexecuted; abandons any frame-end future (see class doc header).
  void discard();

  /**
   * See ctor.
   * @return See above.
   */
  transport::requester_id_t requester_id() const;

  /**
   * Whether requests are being queued (vs. executed on arrival).
   * @return See above.
   */
  bool buffering() const;

  /**
   * Number of items queued.
   * @return See above.
   */
  size_t n_queued() const;

  /**
   * Handles of objects handed out to this requester.
   * @return See above.
   */
  const Handle_registry& handles() const;

  /**
   * Sticky state of this requester.
   * @return See above.
   */
  const Sticky_state_cache& sticky_state() const;

  /**
   * Diagnostic result trace of this requester.
   * @return See above.
   */
  const Result_trace& result_trace() const;

private:
  // Types.

  /// One queued item: a request (possibly a sticky replay) or a release.
  struct Queued
  {
    // Data.

    /// The item.
    std::variant<transport::Request, transport::Release> m_item;

    /// `true` for a sticky-state replay (never replied to, never re-recorded).
    bool m_replay;
  };

  // Methods.

  /**
   * Executes one request; see class doc header.
   *
   * @param req
   *        Request.
   * @param replay
   *        See Queued::m_replay.
   * @param err_code
   *        Not null.  Set to failure reason (reply is due with that error) or cleared.
   * @return Empty if no reply is due regardless of anything (unknown or suppressed operation); else the result
   *         (none on failure).
   */
  std::optional<transport::Value> execute(const transport::Request& req, bool replay, Error_code* err_code);

  /**
   * execute() followed by the reply if due.
   *
   * @param req
   *        Request.
   * @param replay
   *        See Queued::m_replay.
   */
  void execute_and_reply(const transport::Request& req, bool replay);

  /**
   * Drops the handle.
   *
   * @param release
   *        Message body.
   */
  void release(const transport::Release& release);

  /**
   * Drops a request of an abandoned frame; answers it with error::Code::S_REQUEST_CANCELED if it wants a response.
   *
   * @param req
   *        Request.
   */
  void cancel(const transport::Request& req);

  /**
   * Sends the message; logs failure.
   *
   * @param msg
   *        Message.
   */
  void send_or_log(const transport::Envelope& msg);

  /**
   * Returns `true` if the request has its required fields.
   *
   * @param req
   *        Request.
   * @return See above.
   */
  static bool well_formed(const transport::Request& req);

  // Data.

  /// See ctor.
  const transport::requester_id_t m_requester_id;

  /// See ctor.
  const Operation_table& m_operations;

  /// See ctor.
  Send_func m_send_func;

  /// See ctor.
  const Proxy_config m_config;

  /// See buffering().
  bool m_buffering;

  /// Pending queue.
  std::deque<Queued> m_queue;

  /// The outstanding frame-end waiter; null if none.
  boost::shared_ptr<boost::promise<void>> m_frame_end_promise;

  /// Frame ends of abandoned frames yet to arrive.
  size_t m_n_frame_ends_owed;

  /// See handles().
  Handle_registry m_handles;

  /// See sticky_state().
  Sticky_state_cache m_sticky_state;

  /// See result_trace().
  Result_trace m_result_trace;
}; // class Command_proxy

} // namespace glproxy::owner
