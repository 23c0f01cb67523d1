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

#include "glproxy/transport/value.hpp"
#include <map>

namespace glproxy::transport
{

// Types.

/**
 * Requester => owner: invoke operation #m_name with arguments #m_args.  (Envelope supplies the requester ID.)
 * (requester ID, #m_request_id) uniquely identifies a request awaiting a Reply.
 */
struct Request
{
  // Data.

  /// Per-requester unique ID (sequence 1, 2, ...).  The Reply, if any, carries the same ID.
  request_id_t m_request_id = 0;

  /// Operation name; must not be empty.
  std::string m_name;

  /// Arguments: primitives and `Handle_ref`s only (no #Object_ptr may be sent).
  Value_list m_args;

  /// Whether the requester awaits a Reply.
  bool m_wants_response = false;
};

/// Requester => owner: several requests delivered as one transport message, to be executed in order.
struct Batch
{
  // Data.

  /// The requests, in execution order.
  std::vector<Request> m_requests;
};

/// Owner => requester: result of a Request that wanted a response.
struct Reply
{
  // Data.

  /// Request::m_request_id of the request being answered.
  request_id_t m_request_id = 0;

  /// The result: a primitive or a Handle_ref.  None if #m_err_code is truthy.
  Value m_result;

  /// Falsy on success; else the reason the request failed (codes from error::Code only).
  Error_code m_err_code;
};

/**
 * Owner => requester, once, before anything else: the operations the requester may invoke and the
 * named constants it may reference.
 */
struct Bootstrap
{
  // Data.

  /// Every invocable operation name.
  std::vector<std::string> m_operation_names;

  /// Named constant table (typically numeric).
  std::map<std::string, Value> m_constants;
};

/// Owner => requester: render a frame now; answer with Frame_end once done.
struct Frame_begin
{
  // Data.

  /// Owner's wall-clock time at frame start, in milliseconds since the epoch.
  uint64_t m_time_ms = 0;
};

/// Requester => owner: done issuing the current frame's requests.
struct Frame_end
{
};

/// Requester => owner: the requester will not refer to the given handle again; the owner may drop the object.
struct Release
{
  // Data.

  /// Handle being released.
  handle_id_t m_handle_id = 0;
};

/// Any protocol message together with the requester ID to/from which it is addressed.
struct Envelope
{
  // Types.

  /// The body alternatives; see each type's doc header for its direction.
  using Body = std::variant<Bootstrap, Request, Batch, Reply, Frame_begin, Frame_end, Release>;

  // Data.

  /// Requester to which/from which this message is addressed.
  requester_id_t m_requester_id = 0;

  /// The message itself.
  Body m_body;
};

// Free functions.

/**
 * Returns a short name of the Envelope body type (e.g., `request`), for logging.
 *
 * @param val
 *        Message.
 * @return See above.
 */
String_view body_type_name(const Envelope& val);

} // namespace glproxy::transport
