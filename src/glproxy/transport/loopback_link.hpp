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

#include "glproxy/transport/blob_link.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <array>
#include <deque>
#include <utility>

namespace glproxy::transport
{

// Types.

/**
 * Blob_link whose 2 ends live in one process: e.g., requester and owner on separate threads of one program,
 * or unit tests.  Obtain a connected pair via make_pair().  Each end delivers received blobs from its own
 * worker thread (a `flow::async::Single_thread_task_loop`), so the 2 ends' handlers never run on one another's
 * thread.
 *
 * Destroying one end breaks the link: the other end's error handler is invoked (after it has handled every
 * blob sent before the destruction), and its send_blob() fails with error::Code::S_LINK_CLOSED.
 */
class Loopback_link :
  public Blob_link,
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for owning pointer to `*this` type.
  using Ptr = boost::movelib::unique_ptr<Loopback_link>;

  // Constructors/destructor.

  /// See Blob_link dtor and our class doc header.
  ~Loopback_link() override;

  // Methods.

  /**
   * Creates 2 connected ends.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Base name for logging; the ends are named with `-a` and `-b` suffixes.
   * @return The 2 ends.
   */
  static std::pair<Ptr, Ptr> make_pair(flow::log::Logger* logger_ptr, String_view nickname = "loopback");

  /**
   * Implements Blob_link API.
   *
   * @param on_blob_func
   *        See Blob_link.
   * @param on_err_func
   *        See Blob_link.
   * @return See Blob_link.
   */
  bool start_receive(On_blob_func&& on_blob_func, On_err_func&& on_err_func) override;

  /**
   * Implements Blob_link API.
   *
   * @param blob
   *        See Blob_link.
   * @param err_code
   *        See Blob_link.
   */
  void send_blob(const flow::util::Blob& blob, Error_code* err_code = 0) override;

  /**
   * Implements Blob_link API.
   * @return See Blob_link.
   */
  const std::string& nickname() const override;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Short-hand for a blob in flight from one end to the other.
  using Blob_ptr = boost::shared_ptr<flow::util::Blob>;

  /// State shared by the 2 ends of one pair: which ends are still alive.
  struct Pair_state
  {
    // Data.

    /// Protects #m_ends.  Held while one end hands a blob (or its demise) to the other.
    Mutex m_mutex;

    /// The 2 ends, null once destroyed.
    std::array<Loopback_link*, 2> m_ends = { { nullptr, nullptr } };
  };

  // Constructors.

  /**
   * Constructs one end; starts its worker thread.
   *
   * @param logger_ptr
   *        See make_pair().
   * @param nickname
   *        See nickname().
   * @param pair_state
   *        Shared state with the other end.
   * @param end_idx
   *        Index of `*this` in `pair_state->m_ends`.
   */
  explicit Loopback_link(flow::log::Logger* logger_ptr, std::string&& nickname,
                         const boost::shared_ptr<Pair_state>& pair_state, size_t end_idx);

  // Methods.

  /**
   * Invoked by the other end (with `m_pair_state->m_mutex` locked): enqueues the blob for delivery.
   *
   * @param blob
   *        The blob (already a copy owned by nobody else).
   */
  void on_peer_blob(const Blob_ptr& blob);

  /// Invoked by the other end's destructor (with `m_pair_state->m_mutex` locked).
  void on_peer_gone();

  /// In thread W: hands every queued blob to user, then the link-break error if due.  No-op until started.
  void deliver_queued();

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See Pair_state.
  const boost::shared_ptr<Pair_state> m_pair_state;

  /// Index of `*this` in `m_pair_state->m_ends`.
  const size_t m_end_idx;

  /// Protects the data below it (excluding #m_worker).
  mutable Mutex m_mutex;

  /// Whether start_receive() has been called.
  bool m_started;

  /// Whether the other end is gone.
  bool m_peer_gone;

  /// Whether the error handler has been invoked.
  bool m_err_reported;

  /// Blobs received but not yet given to user.
  std::deque<Blob_ptr> m_inbox;

  /// See start_receive().  Touched only in thread W once #m_started.
  On_blob_func m_on_blob_func;

  /// See start_receive().  Touched only in thread W once #m_started.
  On_err_func m_on_err_func;

  /// Thread W: where handlers execute.  Declared last, so it is stopped before the above is destroyed.
  flow::async::Single_thread_task_loop m_worker;
}; // class Loopback_link

} // namespace glproxy::transport
