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

#include "glproxy/transport/protocol.hpp"
#include <flow/log/log.hpp>
#include <flow/util/blob.hpp>
#include <capnp/message.h>
#include <boost/move/unique_ptr.hpp>

namespace glproxy::transport
{

// Types.

/// Settings for Msg_codec.
struct Codec_config
{
  // Data.

  /**
   * Each serialization segment is allocated at this size (rounded down to whole capnp words).  A single leaf
   * (e.g., a large text or bytes value) requiring more than this fails encoding with
   * error::Code::S_SERIALIZE_LEAF_TOO_BIG.
   */
  size_t m_segment_sz = 64 * 1024;

  /// Decoding refuses (as malformed) any message whose traversal would exceed this many capnp words.
  uint64_t m_traversal_limit_words = 8 * 1024 * 1024;
};

/**
 * A `capnp::MessageBuilder` similar to `capnp::MallocMessageBuilder` with the FIXED_SIZE alloc-strategy,
 * its segments being `flow::util::Blob`s of a fixed size (unless capnp asks for a bigger one).  Msg_codec uses
 * it so that it can detect a too-large leaf: a segment larger than the fixed size.
 *
 * Like its super-class it is move-ctible and move-assignable but not copyable.
 */
class Segment_builder :
  public ::capnp::MessageBuilder
{
public:
  // Constructors/destructor.

  /**
   * Constructs the message builder; no segment is allocated until capnp asks for one.
   *
   * @param logger_for_blobs
   *        Logger passed to each `Blob` allocated.
   * @param segment_sz
   *        Size of each segment allocated, in bytes, unless capnp requires a bigger one.  Must be at least
   *        one capnp word.
   */
  explicit Segment_builder(flow::log::Logger* logger_for_blobs, size_t segment_sz);

  // Methods.

  /**
   * Number of segments allocated so far.
   *
   * @return See above.
   */
  size_t n_segments() const;

  /**
   * Size in bytes of the largest segment as actually filled by capnp (not as allocated).
   *
   * @return See above.
   */
  size_t max_filled_segment_sz();

  /**
   * Implements `capnp::MessageBuilder` API: allocates a zeroed segment of `max(min_sz, segment_sz)`.
   *
   * @param min_sz
   *        Minimum size of the segment, in capnp words.
   * @return See above.
   */
  kj::ArrayPtr<::capnp::word> allocateSegment(unsigned int min_sz) override;

private:
  // Data.

  /// See ctor.
  flow::log::Logger* m_logger_for_blobs;

  /// See ctor.
  const size_t m_segment_sz;

  /// The segments allocated so far, in order of allocateSegment() calls.
  std::vector<boost::movelib::unique_ptr<flow::util::Blob>> m_segments;
}; // class Segment_builder

/**
 * Translates between Envelope and its serialization: one `flow::util::Blob` in capnp flat-array form
 * (per schema/wire.capnp).  This is the only place that knows the capnp schema; everything above it deals
 * in Envelope.
 *
 * Encoding refuses any #Object_ptr value: non-transferable objects must be replaced by a Handle_ref first.
 * Decoding refuses anything that does not fully make sense: empty or misaligned serialization, a message
 * capnp itself cannot traverse, unknown body/value types (e.g., from a newer peer), a request without
 * a name or ID, a requester ID of 0, a handle ID of 0, an error code outside error::Code.
 * Refusal yields a protocol-class error, and nothing is partially decoded into the target.
 *
 * ### Thread safety ###
 * encode() and decode() are `const` and may be invoked concurrently.
 */
class Msg_codec :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the codec.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param config
   *        See Codec_config.
   */
  explicit Msg_codec(flow::log::Logger* logger_ptr, const Codec_config& config = Codec_config());

  // Methods.

  /**
   * Serializes the given message into `*target` (replacing its contents).
   *
   * @param msg
   *        Message to encode.
   * @param target
   *        Result goes here on success; untouched on failure.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SERIALIZE_NON_TRANSFERABLE_VALUE, error::Code::S_SERIALIZE_LEAF_TOO_BIG.
   */
  void encode(const Envelope& msg, flow::util::Blob* target, Error_code* err_code = 0) const;

  /**
   * Deserializes the given serialization into `*target` (replacing it).
   *
   * @param serialization
   *        Result of an encode() (presumably, by the opposing peer).
   * @param target
   *        Result goes here on success; untouched on failure.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_DESERIALIZE_FAILED_INSUFFICIENT_SEGMENTS,
   *        error::Code::S_DESERIALIZE_FAILED_SEGMENT_MISALIGNED,
   *        error::Code::S_PROTOCOL_MALFORMED_MESSAGE.
   */
  void decode(const flow::util::Blob& serialization, Envelope* target, Error_code* err_code = 0) const;

  /**
   * Settings given to ctor.
   *
   * @return See above.
   */
  const Codec_config& config() const;

private:
  // Data.

  /// See ctor.
  const Codec_config m_config;
}; // class Msg_codec

} // namespace glproxy::transport
