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
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <array>
#include <deque>
#include <utility>

namespace glproxy::transport
{

// Types.

/**
 * Blob_link over a connected local (Unix domain) stream socket: suitable when the requester and owner contexts
 * are separate processes.  Each blob is framed as an 8-byte little-endian length followed by that many bytes.
 *
 * A Socket_link owns its socket and a worker thread (thread W), on which all socket I/O and all handlers
 * execute.  Sends are queued and written in order, one at a time.  The link breaks on EOF (peer closed),
 * on any socket error, or on a length prefix above #S_MAX_BLOB_SZ; the error handler then receives
 * error::Code::S_LINK_CLOSED (the underlying cause is logged).
 */
class Socket_link :
  public Blob_link,
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for owning pointer to `*this` type.
  using Ptr = boost::movelib::unique_ptr<Socket_link>;

  /// Short-hand for a native socket descriptor.
  using Native_handle = boost::asio::local::stream_protocol::socket::native_handle_type;

  // Constants.

  /// Largest blob we will accept from the peer.  Anything above that is treated as a hosed link.
  static constexpr uint64_t S_MAX_BLOB_SZ = 256 * 1024 * 1024;

  // Constructors/destructor.

  /**
   * Takes over the given already-connected local stream socket (e.g., one end of a `socketpair()`, possibly
   * inherited from a parent process).  Starts thread W.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Name for logging.
   * @param native_handle
   *        Descriptor; `*this` owns it from now on.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: whatever the
   *        boost.asio adopt-descriptor operation emits.  (On error `*this` is unusable: send_blob() fails.)
   */
  explicit Socket_link(flow::log::Logger* logger_ptr, String_view nickname, Native_handle native_handle,
                       Error_code* err_code = 0);

  /// See Blob_link dtor.  Closes the socket, so the peer's link breaks.
  ~Socket_link() override;

  // Methods.

  /**
   * Creates 2 ends connected to each other via a fresh socket pair.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Base name for logging; the ends are named with `-a` and `-b` suffixes.
   * @return The 2 ends.
   */
  static std::pair<Ptr, Ptr> connect_pair(flow::log::Logger* logger_ptr, String_view nickname = "socket");

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

  /// Short-hand for the socket type.
  using Peer_socket = boost::asio::local::stream_protocol::socket;

  /// Short-hand for a framed (length-prefixed) blob awaiting write.
  using Blob_ptr = boost::shared_ptr<flow::util::Blob>;

  // Constants.

  /// Size of the length prefix.
  static constexpr size_t S_HEADER_SZ = sizeof(uint64_t);

  // Methods.

  /// In thread W: async-reads the next length prefix.
  void read_header();

  /**
   * In thread W: async-reads a blob body of the given size (having read its prefix).
   *
   * @param blob_sz
   *        Size from the prefix.
   */
  void read_body(size_t blob_sz);

  /// In thread W: async-writes the front of #m_snd_queue; repeats until the queue is empty.
  void write_next();

  /**
   * In thread W: marks the link hosed (if not already) and reports it to user if started.
   *
   * @param cause
   *        What happened, for logging.
   */
  void hose(const Error_code& cause);

  /// In thread W: invokes the error handler if the link is hosed, started and that has not been done.
  void report_hosed_if_due();

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Thread W.  Its `Task_engine` drives #m_socket; so it must outlive it.
  flow::async::Single_thread_task_loop m_worker;

  /// The socket.  Touched only in thread W after construction.
  Peer_socket m_socket;

  /// Length prefix being read.  Thread W only.
  std::array<uint8_t, S_HEADER_SZ> m_rcv_header;

  /// Blob being read.  Thread W only.
  flow::util::Blob m_rcv_blob;

  /// Protects the data below it.
  mutable Mutex m_mutex;

  /// Framed blobs not yet (fully) written; front one is being written iff #m_snd_in_progress.
  std::deque<Blob_ptr> m_snd_queue;

  /// See #m_snd_queue.
  bool m_snd_in_progress;

  /// Whether the link is broken; if so send_blob() fails.
  bool m_hosed;

  /// Whether start_receive() has been called.
  bool m_started;

  /// Whether the error handler has been invoked.
  bool m_err_reported;

  /// See start_receive().  Invoked only in thread W.
  On_blob_func m_on_blob_func;

  /// See start_receive().  Invoked only in thread W.
  On_err_func m_on_err_func;
}; // class Socket_link

} // namespace glproxy::transport
