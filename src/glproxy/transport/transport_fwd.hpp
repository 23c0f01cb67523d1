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
#include <boost/shared_ptr.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

/**
 * Everything that crosses (or is about to cross) the boundary between a requester context and the owner context.
 *
 * Leaves first:
 *   - #Value: a primitive value, a Handle_ref, or (owner-side only) an #Object_ptr.  The last is never
 *     transported: it is replaced by a Handle_ref before a reply is encoded.
 *   - Protocol messages (Request, Reply, Bootstrap, ...) wrapped in an Envelope; see protocol.hpp.
 *   - Msg_codec: Envelope <=> `flow::util::Blob` via Cap'n Proto (see schema/wire.capnp).
 *   - Blob_link: a FIFO-per-sender bidirectional pipe of blobs.  Loopback_link (in-process) and
 *     Socket_link (local stream socket) implement it.
 *   - Msg_channel: Envelope-level channel on top of a Blob_link and a Msg_codec.
 */
namespace glproxy::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Resource_object;
struct Handle_ref;

struct Request;
struct Batch;
struct Reply;
struct Bootstrap;
struct Frame_begin;
struct Frame_end;
struct Release;
struct Envelope;

class Msg_codec;
class Segment_builder;

class Blob_link;
class Loopback_link;
class Socket_link;
class Msg_channel;

/**
 * Identifies a requester context; every message to or from the owner about a given requester carries it.
 * 0 is a sentinel value and not a valid requester ID.
 */
using requester_id_t = uint32_t;

/// Identifies a request among all requests sent by one requester; assigned from sequence 1, 2, ... (0 = sentinel).
using request_id_t = uint64_t;

/// Identifies a non-transferable owner-side object within one owner::Handle_registry; 0 is a sentinel.
using handle_id_t = uint64_t;

/// Owner-side reference to a non-transferable object: a result of an operation that is not a primitive.
using Object_ptr = boost::shared_ptr<Resource_object>;

/// Byte-string primitive.
using Bytes = std::vector<uint8_t>;

/**
 * A value passed as an argument or returned as a result.  Alternatives, in order: none (void/undefined),
 * boolean, integer, real, text, bytes, handle reference, owner-side object.  All but the last are
 * transferable; see is_transferable().
 *
 * @warning Construct from a C++ value via to_value(), not via the `variant` converting constructor: e.g.,
 *          `Value v = "x"` would pick `bool`.
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string, Bytes, Handle_ref, Object_ptr>;

/// Sequence of #Value; e.g., an argument list.
using Value_list = std::vector<Value>;

// Free functions.

/**
 * Prints string representation of the given Handle_ref to the given `ostream`.
 *
 * @relatesalso Handle_ref
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Handle_ref& val);

/**
 * Prints string representation of the given #Value to the given `ostream`: brief, suitable for logging.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Value& val);

/**
 * Prints string representation of the given #Value_list to the given `ostream`: brief, suitable for logging.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Value_list& val);

/**
 * Prints string representation of the given Request to the given `ostream`.
 *
 * @relatesalso Request
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Request& val);

/**
 * Prints string representation of the given Envelope to the given `ostream`: message type, requester ID and
 * the most useful fields of the body.
 *
 * @relatesalso Envelope
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Envelope& val);

/**
 * Prints string representation of the given Blob_link to the given `ostream`.
 *
 * @relatesalso Blob_link
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Blob_link& val);

/**
 * Prints string representation of the given Msg_channel to the given `ostream`.
 *
 * @relatesalso Msg_channel
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Msg_channel& val);

} // namespace glproxy::transport
