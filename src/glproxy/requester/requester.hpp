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

#include "glproxy/requester/call_stub.hpp"
#include "glproxy/transport/msg_channel.hpp"
#include "glproxy/transport/protocol.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/unordered_map.hpp>
#include <map>
#include <set>

namespace glproxy::requester
{

// Types.

/// Settings for Requester.
struct Requester_config
{
  // Data.

  /// Timeout used by Completion::get() when none is given; `Fine_duration::max()` means no limit.
  Fine_duration m_reply_timeout = Fine_duration::max();

  /**
   * If `true`, calls issued from within the frame handler are not sent one by one but accumulated and sent
   * as a single transport::Batch just before Frame_end.  The owner executes them identically either way.
   */
  bool m_batch_frame_calls = false;
};

/**
 * The requester-context end of the proxy protocol; one per requester context.  Owns the transport::Msg_channel
 * to the owner.
 *
 * ### Lifecycle ###
 *   - Construct; then start() with the bootstrap handler and the frame handler.
 *   - The owner sends Bootstrap: the set of operation names and constants.  From then on stub() and constant()
 *     work, and the bootstrap handler runs.
 *   - The owner repeatedly sends Frame_begin: the frame handler runs; when it returns Requester sends Frame_end.
 *     The owner executes requests issued in a frame only after Frame_end (see Completion::get() warning).
 *   - Destroy: every unresolved Completion resolves with error::Code::S_REQUEST_CANCELED.
 *
 * ### Threads ###
 * Handlers given to start() execute in thread U, an internal thread: never concurrently with each other.
 * Messages are received in thread W (that of the link); replies resolve Completions from there, so a thread
 * waiting on Completion::get() (including thread U, outside the frame handler caveat) is not starved.
 * All public methods may be invoked from any thread, concurrently.
 *
 * ### Ordering ###
 * Requests are sent in request-ID order, which is the order in which the calls were issued (as serialized
 * among concurrent callers).
 */
class Requester :
  public flow::log::Log_context
{
public:
  // Types.

  /// Invoked once, when Bootstrap has been processed.
  using On_bootstrap_func = Function<void ()>;

  /// Invoked on each Frame_begin with the owner's frame time (ms since epoch).
  using On_frame_func = Function<void (uint64_t time_ms)>;

  /// Invoked once if the link to the owner breaks.
  using On_err_func = Function<void (const Error_code& err_code)>;

  // Constructors/destructor.

  /**
   * Constructs the requester over the given (not yet started) link.  Does not start receiving.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param requester_id
   *        ID by which the owner knows us; not 0.
   * @param link
   *        Link to the owner; not null.
   * @param config
   *        See Requester_config.
   */
  explicit Requester(flow::log::Logger* logger_ptr, transport::requester_id_t requester_id,
                     transport::Msg_channel::Link_ptr&& link, const Requester_config& config = Requester_config());

  /// Stops thread U (a running handler finishes first), closes the link, cancels pending calls.
  ~Requester();

  // Methods.

  /**
   * Starts processing messages from the owner.  May be invoked at most once.
   *
   * @param on_bootstrap_func
   *        See On_bootstrap_func.
   * @param on_frame_func
   *        See On_frame_func.
   * @param on_err_func
   *        See On_err_func.
   * @return `false` if already started (no-op); `true` otherwise.
   */
  bool start(On_bootstrap_func&& on_bootstrap_func, On_frame_func&& on_frame_func, On_err_func&& on_err_func);

  /**
   * Returns the stub for the given operation.
   *
   * @param name
   *        Operation name.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NOT_BOOTSTRAPPED, error::Code::S_UNKNOWN_OPERATION.
   * @return The stub; or a null stub on error.
   */
  Call_stub stub(String_view name, Error_code* err_code = 0);

  /**
   * Returns the named constant as advertised by the owner.
   *
   * @param name
   *        Constant name.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NOT_BOOTSTRAPPED, error::Code::S_UNKNOWN_OPERATION (no such constant).
   * @return The value; or none on error.
   */
  transport::Value constant(String_view name, Error_code* err_code = 0) const;

  /**
   * Tells the owner we are done with the given handle; the owner forgets the object.  Using the handle
   * afterwards fails with error::Code::S_DANGLING_HANDLE_REFERENCE.
   *
   * @param handle
   *        Handle previously received as a result.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NOT_BOOTSTRAPPED; those of transport::Msg_channel::send().
   */
  void release(const transport::Handle_ref& handle, Error_code* err_code = 0);

  /// Resolves every unresolved Completion with error::Code::S_REQUEST_CANCELED.  Later replies are dropped.
  void cancel_all();

  /**
   * Whether Bootstrap has been processed.
   * @return See above.
   */
  bool bootstrapped() const;

  /**
   * Operation names advertised by the owner (empty before Bootstrap).
   * @return See above.
   */
  std::vector<std::string> operation_names() const;

  /**
   * Number of calls awaiting a reply.
   * @return See above.
   */
  size_t n_pending() const;

  /**
   * See ctor.
   * @return See above.
   */
  transport::requester_id_t id() const;

private:
  // Friends.

  /// It calls issue().
  friend class Call_stub;

  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Short-hand for the promise side of a pending call.
  using Promise_ptr = boost::shared_ptr<boost::promise<Call_result>>;

  // Methods.

  /**
   * Sends (or batches) a Request for the given operation.
   *
   * @param name
   *        Operation name.
   * @param args
   *        Arguments.
   * @param wants_response
   *        See transport::Request.
   * @return If `wants_response`: the Completion (possibly already failed).  Otherwise: a not-valid() Completion
   *         on success, or an already failed one.
   */
  Completion issue(const std::string& name, transport::Value_list&& args, bool wants_response);

  /**
   * Sends the message, unless we are collecting a batch and it is a request: then appends to #m_batch.
   * Any other message flushes #m_batch first.  #m_mutex must be locked.
   *
   * @param msg
   *        Message.
   * @param err_code
   *        Not null.  Result of send.
   */
  void send_locked(transport::Envelope&& msg, Error_code* err_code);

  /**
   * Sends #m_batch (if not empty) as one message.  #m_mutex must be locked.
   *
   * @param err_code
   *        Not null.  Result of send.
   */
  void flush_batch_locked(Error_code* err_code);

  /**
   * Fails every pending call with the given code and forgets them.
   *
   * @param err_code
   *        The failure.
   */
  void fail_pending(const Error_code& err_code);

  /**
   * In thread W: handles message from the owner.
   *
   * @param msg
   *        Message.
   */
  void on_msg(transport::Envelope&& msg);

  /**
   * In thread W: handles Bootstrap.
   *
   * @param bootstrap
   *        Message body.
   */
  void on_bootstrap(transport::Bootstrap&& bootstrap);

  /**
   * In thread W: resolves the matching pending call.
   *
   * @param reply
   *        Message body.
   */
  void on_reply(transport::Reply&& reply);

  /**
   * In thread U: runs the frame handler; then sends the batch (if any) and Frame_end.
   *
   * @param time_ms
   *        See transport::Frame_begin.
   */
  void run_frame(uint64_t time_ms);

  // Data.

  /// See id().
  const transport::requester_id_t m_id;

  /// See ctor.
  const Requester_config m_config;

  /// Protects the data below it (and orders sends).
  mutable Mutex m_mutex;

  /// Whether start() has been called.
  bool m_started;

  /// Whether Bootstrap has been processed.
  bool m_bootstrapped;

  /// Whether the link has broken.
  bool m_link_closed;

  /// Operation names from Bootstrap.
  std::set<std::string> m_operation_names;

  /// Constants from Bootstrap.
  std::map<std::string, transport::Value> m_constants;

  /// Next request ID.
  transport::request_id_t m_next_request_id;

  /// Pending-completion table: calls awaiting a reply.
  boost::unordered_map<transport::request_id_t, Promise_ptr> m_pending;

  /// Whether requests are currently being accumulated into #m_batch (frame handler running, batching enabled).
  bool m_collecting_batch;

  /// See #m_collecting_batch.
  std::vector<transport::Request> m_batch;

  /// See start().
  On_bootstrap_func m_on_bootstrap_func;

  /// See start().
  On_frame_func m_on_frame_func;

  /// See start().
  On_err_func m_on_err_func;

  /// Thread U.
  flow::async::Single_thread_task_loop m_user_loop;

  /// The channel to the owner.  Null after destructor closes it.
  boost::movelib::unique_ptr<transport::Msg_channel> m_channel;
}; // class Requester

} // namespace glproxy::requester
