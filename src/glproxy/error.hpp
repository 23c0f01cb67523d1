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

#include "glproxy/common.hpp"
#include <boost/system/error_code.hpp>
#include <iosfwd>

/**
 * Namespace containing the glproxy error code set.  These are issued via the standard boost.system
 * `Error_code` mechanism: an API that can fail takes a trailing `Error_code* err_code` (null means: throw
 * `flow::error::Runtime_error` wrapping the code instead) or reports a code in a result/reply.
 *
 * Any code here can be converted implicitly to `Error_code` via make_error_code(); and printed/parsed
 * via `operator<<()`/`operator>>()` (symbolic form, e.g., `DANGLING_HANDLE_REFERENCE`).
 */
namespace glproxy::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/// All possible errors returned (via `Error_code` arguments or replies) by glproxy functions/methods.
enum class Code
{
  /// Protocol error: received message is malformed (missing/invalid required fields or unknown message type).
  S_PROTOCOL_MALFORMED_MESSAGE = S_CODE_LOWEST_INT_VALUE,

  /// Protocol error: message is of a type not expected in this direction (e.g., a reply sent to the owner).
  S_PROTOCOL_UNEXPECTED_MESSAGE,

  /// Protocol error: tried to deserialize an empty serialization (not even a segment table).
  S_DESERIALIZE_FAILED_INSUFFICIENT_SEGMENTS,

  /// Protocol error: serialization size is not a multiple of the capnp word size.
  S_DESERIALIZE_FAILED_SEGMENT_MISALIGNED,

  /**
   * Serialization: a value (e.g., text or bytes) is so large as to require a segment exceeding the configured
   * maximum segment size.
   */
  S_SERIALIZE_LEAF_TOO_BIG,

  /// Serialization: a non-transferable value (an owner-side object) was proposed for transport.
  S_SERIALIZE_NON_TRANSFERABLE_VALUE,

  /// Request: an argument refers to a handle absent from the owner's handle registry.
  S_DANGLING_HANDLE_REFERENCE,

  /// Request: operation name is not among those the owner advertised.
  S_UNKNOWN_OPERATION,

  /// Request: argument count or argument type does not match what the operation takes.
  S_ARGUMENT_TYPE_MISMATCH,

  /// Request: the operation itself reported failure (threw) while being applied to the owner resource.
  S_OPERATION_FAILED,

  /// Waiting for a reply or frame-end signal exceeded the allowed time: the peer did not respond.
  S_PEER_UNRESPONSIVE,

  /// A pending request was canceled before its reply arrived (e.g., the requester is shutting down).
  S_REQUEST_CANCELED,

  /// Requester: operation attempted before the owner's bootstrap message was received.
  S_NOT_BOOTSTRAPPED,

  /// Owner: frame collection requested while a previous one still awaits its frame-end signal.
  S_FRAME_COLLECTION_IN_PROGRESS,

  /// Link: the underlying blob link is closed or hosed; nothing more can be sent or received.
  S_LINK_CLOSED,

  /// Owner: a requester with that ID was already added.
  S_DUPLICATE_REQUESTER_ID,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a Code `enum` value, creates a matching `Error_code`, which will have the glproxy category.
 *
 * @param err_code
 *        Code value.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a Code from a standard input stream: its symbolic form (case-insensitive) or its
 * numeric value.  Unknown input yields Code::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a Code to a standard output stream in symbolic form (e.g., `PEER_UNRESPONSIVE`).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace glproxy::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` glproxy::error::Code convertible
 * to `Error_code`.  This is the official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::glproxy::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
