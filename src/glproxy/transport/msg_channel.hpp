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
#include "glproxy/transport/msg_codec.hpp"
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>

namespace glproxy::transport
{

// Types.

/**
 * Envelope-level bidirectional channel: a Blob_link (owned) with a Msg_codec on top.  One Msg_channel connects
 * one requester context with the owner context; each side holds one end.
 *
 * Ordering is that of the underlying link: FIFO per sender.  Inbound blobs that do not decode into a well-formed
 * Envelope are logged and dropped (never partially delivered); the channel remains usable.  A link break is
 * reported via the error handler given to start(), once.
 *
 * ### Thread safety ###
 * send() may be invoked concurrently, including from within handlers.  Handlers execute in the link's thread
 * (see Blob_link), never concurrently with each other.  Do not destroy `*this` from within a handler.
 */
class Msg_channel :
  public flow::log::Log_context
{
public:
  // Types.

  /// Owning pointer to the link.
  using Link_ptr = boost::movelib::unique_ptr<Blob_link>;

  /// Handler invoked with each well-formed inbound message.
  using On_envelope_func = Function<void (Envelope&& msg)>;

  /// Handler invoked once when the link breaks.
  using On_err_func = Blob_link::On_err_func;

  // Constructors/destructor.

  /**
   * Constructs the channel, taking over the link (which must not have been started).  Does not start receiving.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param link
   *        The link; must not be null.
   * @param codec_config
   *        See Msg_codec.
   */
  explicit Msg_channel(flow::log::Logger* logger_ptr, Link_ptr&& link,
                       const Codec_config& codec_config = Codec_config());

  /// Destroys the link; no handler runs after this returns.
  ~Msg_channel();

  // Methods.

  /**
   * Starts delivering inbound messages.  May be invoked at most once.
   *
   * @param on_msg_func
   *        See On_envelope_func.
   * @param on_err_func
   *        See On_err_func.
   * @return `false` if already started (no-op); `true` otherwise.
   */
  bool start(On_envelope_func&& on_msg_func, On_err_func&& on_err_func);

  /**
   * Encodes and sends the given message.
   *
   * @param msg
   *        The message.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        those of Msg_codec::encode() and Blob_link::send_blob().
   */
  void send(const Envelope& msg, Error_code* err_code = 0);

  /**
   * The underlying link.
   * @return See above.
   */
  const Blob_link& link() const;

private:
  // Data.

  /// Does the (de)serialization.
  const Msg_codec m_codec;

  /// The link; declared last so it (and its thread, which may be inside our handlers) goes away first.
  Link_ptr m_link;
}; // class Msg_channel

} // namespace glproxy::transport
