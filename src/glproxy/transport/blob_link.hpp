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

#include "glproxy/transport/transport_fwd.hpp"
#include <flow/util/blob.hpp>

namespace glproxy::transport
{

// Types.

/**
 * Interface of a bidirectional pipe of opaque blobs connecting 2 contexts: one end lives in a requester context,
 * the other in the owner context.  Implemented by Loopback_link (in-process) and Socket_link (local stream
 * socket); Msg_channel sits on top of it and never cares which.
 *
 * ### Ordering ###
 * Blobs sent by one end arrive at the other end in the order sent (FIFO per sender).  Nothing is promised
 * about the relative order of blobs arriving over *different* links, even into one context.
 *
 * ### Handlers ###
 * Once start_receive() is called, each received blob is passed to the blob handler, in order, from an
 * unspecified thread (always the same one for a given `*this`; never concurrently with itself).  Blobs that
 * arrive before start_receive() are kept and handed over once it is called.  If the link breaks (peer gone,
 * socket error) the error handler is invoked exactly once; after that neither handler is invoked again.
 * Destroying `*this` means no handler is invoked after the destructor returns; hence do not destroy `*this`
 * from inside a handler.
 *
 * ### Thread safety ###
 * send_blob() may be invoked concurrently with itself and with handlers executing (including from inside them).
 */
class Blob_link
{
public:
  // Types.

  /// Handler invoked with each received blob; it may take ownership (move) of the blob.
  using On_blob_func = Function<void (flow::util::Blob& blob)>;

  /// Handler invoked once on link break.
  using On_err_func = Function<void (const Error_code& err_code)>;

  // Constructors/destructor.

  /// Boring virtual destructor.  See class doc header regarding handlers.
  virtual ~Blob_link();

  // Methods.

  /**
   * Starts handing received blobs to `on_blob_func`.  May be invoked at most once.
   *
   * @param on_blob_func
   *        See class doc header.
   * @param on_err_func
   *        See class doc header.
   * @return `false` if already started (no-op); `true` otherwise.
   */
  virtual bool start_receive(On_blob_func&& on_blob_func, On_err_func&& on_err_func) = 0;

  /**
   * Sends a copy of the given blob to the opposing end.  Returns quickly; does not await delivery.
   *
   * @param blob
   *        Blob to send; may be discarded by caller immediately upon return.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_LINK_CLOSED (peer gone or link hosed; nothing was sent).
   */
  virtual void send_blob(const flow::util::Blob& blob, Error_code* err_code = 0) = 0;

  /**
   * Name for logging.
   *
   * @return See above.
   */
  virtual const std::string& nickname() const = 0;
}; // class Blob_link

} // namespace glproxy::transport
