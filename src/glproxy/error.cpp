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
#include "glproxy/error.hpp"
#include <flow/util/util.hpp>
#include <cassert>

namespace glproxy::error
{

// Types.

/// The boost.system category for errors returned by glproxy.
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's conceptual name.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string describing the given Code value in English.
   *
   * @param val
   *        Error code value (as an `int`).
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns a brief string, without the `S_` prefix, naming the given Code (e.g., `LINK_CLOSED`).
   *
   * @param code
   *        Code value.
   * @return See above.
   */
  static String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "glproxy";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_PROTOCOL_MALFORMED_MESSAGE:
    return "Protocol error: received message is malformed (missing/invalid required fields or unknown message "
           "type).";
  case Code::S_PROTOCOL_UNEXPECTED_MESSAGE:
    return "Protocol error: message is of a type not expected in this direction (e.g., a reply sent to the owner).";
  case Code::S_DESERIALIZE_FAILED_INSUFFICIENT_SEGMENTS:
    return "Protocol error: tried to deserialize an empty serialization (not even a segment table).";
  case Code::S_DESERIALIZE_FAILED_SEGMENT_MISALIGNED:
    return "Protocol error: serialization size is not a multiple of the capnp word size.";
  case Code::S_SERIALIZE_LEAF_TOO_BIG:
    return "Serialization: a value (e.g., text or bytes) is so large as to require a segment exceeding the "
           "configured maximum segment size.";
  case Code::S_SERIALIZE_NON_TRANSFERABLE_VALUE:
    return "Serialization: a non-transferable value (an owner-side object) was proposed for transport.";
  case Code::S_DANGLING_HANDLE_REFERENCE:
    return "Request: an argument refers to a handle absent from the owner's handle registry.";
  case Code::S_UNKNOWN_OPERATION:
    return "Request: operation name is not among those the owner advertised.";
  case Code::S_ARGUMENT_TYPE_MISMATCH:
    return "Request: argument count or argument type does not match what the operation takes.";
  case Code::S_OPERATION_FAILED:
    return "Request: the operation itself reported failure (threw) while being applied to the owner resource.";
  case Code::S_PEER_UNRESPONSIVE:
    return "Waiting for a reply or frame-end signal exceeded the allowed time: the peer did not respond.";
  case Code::S_REQUEST_CANCELED:
    return "A pending request was canceled before its reply arrived (e.g., the requester is shutting down).";
  case Code::S_NOT_BOOTSTRAPPED:
    return "Requester: operation attempted before the owner's bootstrap message was received.";
  case Code::S_FRAME_COLLECTION_IN_PROGRESS:
    return "Owner: frame collection requested while a previous one still awaits its frame-end signal.";
  case Code::S_LINK_CLOSED:
    return "Link: the underlying blob link is closed or hosed; nothing more can be sent or received.";
  case Code::S_DUPLICATE_REQUESTER_ID:
    return "Owner: a requester with that ID was already added.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_PROTOCOL_MALFORMED_MESSAGE:
    return "PROTOCOL_MALFORMED_MESSAGE";
  case Code::S_PROTOCOL_UNEXPECTED_MESSAGE:
    return "PROTOCOL_UNEXPECTED_MESSAGE";
  case Code::S_DESERIALIZE_FAILED_INSUFFICIENT_SEGMENTS:
    return "DESERIALIZE_FAILED_INSUFFICIENT_SEGMENTS";
  case Code::S_DESERIALIZE_FAILED_SEGMENT_MISALIGNED:
    return "DESERIALIZE_FAILED_SEGMENT_MISALIGNED";
  case Code::S_SERIALIZE_LEAF_TOO_BIG:
    return "SERIALIZE_LEAF_TOO_BIG";
  case Code::S_SERIALIZE_NON_TRANSFERABLE_VALUE:
    return "SERIALIZE_NON_TRANSFERABLE_VALUE";
  case Code::S_DANGLING_HANDLE_REFERENCE:
    return "DANGLING_HANDLE_REFERENCE";
  case Code::S_UNKNOWN_OPERATION:
    return "UNKNOWN_OPERATION";
  case Code::S_ARGUMENT_TYPE_MISMATCH:
    return "ARGUMENT_TYPE_MISMATCH";
  case Code::S_OPERATION_FAILED:
    return "OPERATION_FAILED";
  case Code::S_PEER_UNRESPONSIVE:
    return "PEER_UNRESPONSIVE";
  case Code::S_REQUEST_CANCELED:
    return "REQUEST_CANCELED";
  case Code::S_NOT_BOOTSTRAPPED:
    return "NOT_BOOTSTRAPPED";
  case Code::S_FRAME_COLLECTION_IN_PROGRESS:
    return "FRAME_COLLECTION_IN_PROGRESS";
  case Code::S_LINK_CLOSED:
    return "LINK_CLOSED";
  case Code::S_DUPLICATE_REQUESTER_ID:
    return "DUPLICATE_REQUESTER_ID";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace glproxy::error
