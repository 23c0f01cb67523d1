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

#include "glproxy/requester/requester_fwd.hpp"
#include "glproxy/transport/value.hpp"
#include <boost/thread/future.hpp>

namespace glproxy::requester
{

// Types.

/// What a Completion resolves to.
struct Call_result
{
  // Data.

  /// The result on success: a primitive or a transport::Handle_ref.  None on failure.
  transport::Value m_value;

  /// Falsy on success; else why the call failed.
  Error_code m_err_code;
};

/**
 * Result channel of one issued call: resolves exactly once, with the owner's reply, a local failure
 * (e.g., unknown operation), or cancellation (Requester::cancel_all(), link break, Requester destruction).
 * If the reply never arrives and nobody cancels, it never resolves; get() with a finite timeout bounds the wait.
 *
 * Movable, not copyable.  get() may be invoked at most once on a given Completion (it consumes the result).
 */
class Completion
{
public:
  // Constructors/destructor.

  /// Constructs a Completion that is not valid(): it refers to no call.
  Completion();

  /**
   * Constructs a Completion that resolves when the given future does.  Used by Requester.
   *
   * @param future
   *        Future side of the pending-call entry.
   * @param request_id
   *        See request_id().
   * @param default_timeout
   *        Timeout used by get() without a timeout argument.
   */
  explicit Completion(boost::unique_future<Call_result>&& future, transport::request_id_t request_id,
                      Fine_duration default_timeout);

  // Methods.

  /**
   * Returns a Completion that is already resolved with the given failure.
   *
   * @param err_code
   *        The failure; must be truthy.
   * @return See above.
   */
  static Completion failed(const Error_code& err_code);

  /**
   * Whether `*this` refers to a call whose result has not been consumed by get().
   * @return See above.
   */
  bool valid() const;

  /**
   * Whether get() would return immediately.
   * @return See above.  `false` if not valid().
   */
  bool ready() const;

  /**
   * ID of the Request sent; 0 if none was sent (local failure).
   * @return See above.
   */
  transport::request_id_t request_id() const;

  /**
   * Awaits the result, subject to the default timeout given by Requester (see Requester_config).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: see other get().
   * @return See other get().
   */
  transport::Value get(Error_code* err_code = 0);

  /**
   * Awaits the result for up to the given time.  Behavior is undefined if not valid().
   *
   * @warning Do not wait, from within Requester's frame handler, on a call issued in that same frame handler:
   *          the owner defers execution (hence the reply) until the frame is collected, which happens only
   *          once the frame handler returns.  (With a finite timeout, that wait ends in
   *          error::Code::S_PEER_UNRESPONSIVE.)
   *
   * @param timeout
   *        Maximum wait; `Fine_duration::max()` means no limit.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_PEER_UNRESPONSIVE (timeout; `*this` remains valid() so one may wait again);
   *        error::Code::S_REQUEST_CANCELED; error::Code::S_LINK_CLOSED;
   *        whatever failure the owner reported (e.g., error::Code::S_DANGLING_HANDLE_REFERENCE);
   *        whatever failure was detected locally (e.g., error::Code::S_UNKNOWN_OPERATION).
   * @return The result value on success; none on failure.
   */
  transport::Value get(Fine_duration timeout, Error_code* err_code = 0);

private:
  // Data.

  /// Resolves with the result.
  boost::unique_future<Call_result> m_future;

  /// See request_id().
  transport::request_id_t m_request_id;

  /// See get().
  Fine_duration m_default_timeout;
}; // class Completion

} // namespace glproxy::requester
