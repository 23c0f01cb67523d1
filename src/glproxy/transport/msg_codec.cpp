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
#include "glproxy/transport/msg_codec.hpp"
#include "glproxy/transport/detail/capnp_util.hpp"
#include "glproxy/transport/schema/wire.capnp.h"
#include <capnp/serialize.h>
#include <kj/io.h>
#include <kj/exception.h>
#include <cassert>
#include <cstring>

namespace glproxy::transport
{

namespace
{

// Free functions: Envelope <=> schema::Envelope.  Encoders return `false` on non-transferable value;
// decoders return `false` on malformed input.

bool encode_value(const Value& val, schema::Value::Builder target)
{
  return std::visit([&](const auto& alt) -> bool
  {
    using Alt = std::decay_t<decltype(alt)>;

    if constexpr(std::is_same_v<Alt, std::monostate>)
    {
      target.setNone();
    }
    else if constexpr(std::is_same_v<Alt, bool>)
    {
      target.setBoolean(alt);
    }
    else if constexpr(std::is_same_v<Alt, int64_t>)
    {
      target.setInteger(alt);
    }
    else if constexpr(std::is_same_v<Alt, double>)
    {
      target.setReal(alt);
    }
    else if constexpr(std::is_same_v<Alt, std::string>)
    {
      target.setText(::capnp::Text::Reader(alt.c_str(), alt.size()));
    }
    else if constexpr(std::is_same_v<Alt, Bytes>)
    {
      target.setBytes(::capnp::Data::Reader(alt.data(), alt.size()));
    }
    else if constexpr(std::is_same_v<Alt, Handle_ref>)
    {
      target.initHandle().setHandleId(alt.m_handle_id);
    }
    else
    {
      static_assert(std::is_same_v<Alt, Object_ptr>, "Unhandled Value alternative?");
      return false;
    }
    return true;
  }, val);
} // encode_value()

bool encode_request(const Request& req, schema::Request::Builder target)
{
  target.setRequestId(req.m_request_id);
  target.setName(::capnp::Text::Reader(req.m_name.c_str(), req.m_name.size()));
  target.setWantsResponse(req.m_wants_response);

  auto args = target.initArgs(req.m_args.size());
  for (size_t idx = 0; idx != req.m_args.size(); ++idx)
  {
    if (!encode_value(req.m_args[idx], args[idx]))
    {
      return false;
    }
  }
  return true;
}

bool encode_body(const Envelope::Body& body, schema::Envelope::Body::Builder target)
{
  return std::visit([&](const auto& alt) -> bool
  {
    using Alt = std::decay_t<decltype(alt)>;

    if constexpr(std::is_same_v<Alt, Bootstrap>)
    {
      auto bootstrap = target.initBootstrap();
      auto names = bootstrap.initOperationNames(alt.m_operation_names.size());
      for (size_t idx = 0; idx != alt.m_operation_names.size(); ++idx)
      {
        const auto& name = alt.m_operation_names[idx];
        names.set(idx, ::capnp::Text::Reader(name.c_str(), name.size()));
      }

      auto constants = bootstrap.initConstants(alt.m_constants.size());
      size_t idx = 0;
      for (const auto& [name, val] : alt.m_constants)
      {
        auto constant = constants[idx++];
        constant.setName(::capnp::Text::Reader(name.c_str(), name.size()));
        if (!encode_value(val, constant.initValue()))
        {
          return false;
        }
      }
      return true;
    }
    else if constexpr(std::is_same_v<Alt, Request>)
    {
      return encode_request(alt, target.initRequest());
    }
    else if constexpr(std::is_same_v<Alt, Batch>)
    {
      auto reqs = target.initBatch(alt.m_requests.size());
      for (size_t idx = 0; idx != alt.m_requests.size(); ++idx)
      {
        if (!encode_request(alt.m_requests[idx], reqs[idx]))
        {
          return false;
        }
      }
      return true;
    }
    else if constexpr(std::is_same_v<Alt, Reply>)
    {
      auto reply = target.initReply();
      reply.setRequestId(alt.m_request_id);
      if (alt.m_err_code)
      {
        // Only our own codes can be expressed on the wire; anything else is an operation failure as far as peer cares.
        const bool ours = alt.m_err_code.category() == Error_code(error::Code::S_OPERATION_FAILED).category();
        reply.setErrorCode(ours ? static_cast<uint32_t>(alt.m_err_code.value())
                                : static_cast<uint32_t>(error::Code::S_OPERATION_FAILED));
      }
      return encode_value(alt.m_result, reply.initResult());
    }
    else if constexpr(std::is_same_v<Alt, Frame_begin>)
    {
      target.initFrameBegin().setTimeMs(alt.m_time_ms);
      return true;
    }
    else if constexpr(std::is_same_v<Alt, Frame_end>)
    {
      target.setFrameEnd();
      return true;
    }
    else
    {
      static_assert(std::is_same_v<Alt, Release>, "Unhandled Envelope::Body alternative?");
      target.initRelease().setHandleId(alt.m_handle_id);
      return true;
    }
  }, body);
} // encode_body()

bool decode_value(schema::Value::Reader val, Value* target)
{
  using Which = schema::Value::Which;

  switch (val.which())
  {
  case Which::NONE:
    *target = Value();
    return true;
  case Which::BOOLEAN:
    *target = to_value(val.getBoolean());
    return true;
  case Which::INTEGER:
    *target = to_value(val.getInteger());
    return true;
  case Which::REAL:
    *target = to_value(val.getReal());
    return true;
  case Which::TEXT:
  {
    const auto text = val.getText();
    target->emplace<std::string>(text.cStr(), text.size());
    return true;
  }
  case Which::BYTES:
  {
    const auto bytes = val.getBytes();
    target->emplace<Bytes>(bytes.begin(), bytes.end());
    return true;
  }
  case Which::HANDLE:
  {
    const auto handle_id = val.getHandle().getHandleId();
    if (handle_id == 0)
    {
      return false;
    }
    *target = to_value(Handle_ref{ handle_id });
    return true;
  }
  }
  return false; // Unknown discriminant: perhaps a newer peer.
} // decode_value()

bool decode_request(schema::Request::Reader req, Request* target)
{
  target->m_request_id = req.getRequestId();
  const auto name = req.getName();
  target->m_name.assign(name.cStr(), name.size());
  target->m_wants_response = req.getWantsResponse();

  if ((target->m_request_id == 0) || target->m_name.empty())
  {
    return false;
  }

  const auto args = req.getArgs();
  target->m_args.resize(args.size());
  for (size_t idx = 0; idx != args.size(); ++idx)
  {
    if (!decode_value(args[idx], &target->m_args[idx]))
    {
      return false;
    }
  }
  return true;
}

bool decode_body(schema::Envelope::Body::Reader body, Envelope::Body* target)
{
  using Which = schema::Envelope::Body::Which;

  switch (body.which())
  {
  case Which::BOOTSTRAP:
  {
    const auto bootstrap_in = body.getBootstrap();
    Bootstrap bootstrap;
    for (const auto name : bootstrap_in.getOperationNames())
    {
      bootstrap.m_operation_names.emplace_back(name.cStr(), name.size());
    }
    for (const auto constant : bootstrap_in.getConstants())
    {
      const auto name = constant.getName();
      if ((name.size() == 0) || (!decode_value(constant.getValue(), &bootstrap.m_constants[name.cStr()])))
      {
        return false;
      }
    }
    *target = std::move(bootstrap);
    return true;
  }
  case Which::REQUEST:
  {
    Request req;
    if (!decode_request(body.getRequest(), &req))
    {
      return false;
    }
    *target = std::move(req);
    return true;
  }
  case Which::BATCH:
  {
    const auto reqs = body.getBatch();
    Batch batch;
    batch.m_requests.resize(reqs.size());
    for (size_t idx = 0; idx != reqs.size(); ++idx)
    {
      if (!decode_request(reqs[idx], &batch.m_requests[idx]))
      {
        return false;
      }
    }
    *target = std::move(batch);
    return true;
  }
  case Which::REPLY:
  {
    const auto reply_in = body.getReply();
    Reply reply;
    reply.m_request_id = reply_in.getRequestId();
    const auto raw_code = reply_in.getErrorCode();
    if ((reply.m_request_id == 0)
        || ((raw_code != 0)
            && ((raw_code < static_cast<uint32_t>(error::S_CODE_LOWEST_INT_VALUE))
                || (raw_code >= static_cast<uint32_t>(error::Code::S_END_SENTINEL))))
        || (!decode_value(reply_in.getResult(), &reply.m_result)))
    {
      return false;
    }
    if (raw_code != 0)
    {
      reply.m_err_code = static_cast<error::Code>(raw_code);
    }
    *target = std::move(reply);
    return true;
  }
  case Which::FRAME_BEGIN:
    *target = Frame_begin{ body.getFrameBegin().getTimeMs() };
    return true;
  case Which::FRAME_END:
    *target = Frame_end();
    return true;
  case Which::RELEASE:
  {
    const auto handle_id = body.getRelease().getHandleId();
    if (handle_id == 0)
    {
      return false;
    }
    *target = Release{ handle_id };
    return true;
  }
  }
  return false; // Unknown discriminant: perhaps a newer peer.
} // decode_body()

} // namespace (anonymous)

// Segment_builder implementations.

Segment_builder::Segment_builder(flow::log::Logger* logger_for_blobs, size_t segment_sz) :
  m_logger_for_blobs(logger_for_blobs),
  m_segment_sz(segment_sz)
{
  assert((m_segment_sz >= sizeof(::capnp::word)) && "Segment size must fit at least one word.");
}

size_t Segment_builder::n_segments() const
{
  return m_segments.size();
}

size_t Segment_builder::max_filled_segment_sz()
{
  size_t max_sz = 0;
  for (const auto capnp_seg : getSegmentsForOutput())
  {
    max_sz = std::max(max_sz, capnp_seg.asBytes().size());
  }
  return max_sz;
}

kj::ArrayPtr<::capnp::word> Segment_builder::allocateSegment(unsigned int min_sz) // Virtual.
{
  using Word = ::capnp::word;
  using flow::util::Blob;
  constexpr size_t WORD_SZ = sizeof(Word);

  /* capnp needs at least min_sz words (probably to store some leaf); we give it the fixed size so it can pack
   * more objects in there without calling us for each one -- unless min_sz exceeds that, in which case we have
   * no choice.  The encoder will then catch the oversized segment and refuse. */
  const size_t seg_sz = std::max(min_sz * WORD_SZ, (m_segment_sz / WORD_SZ) * WORD_SZ);

  m_segments.emplace_back(new Blob(m_logger_for_blobs, seg_sz));
  auto& blob = *(m_segments.back());
  // capnp requires: it must be zeroed.  (Blob intentionally doesn't zero.)
  std::memset(blob.begin(), 0, blob.size());

  return kj::ArrayPtr<Word>(reinterpret_cast<Word*>(blob.begin()), reinterpret_cast<Word*>(blob.end()));
}

// Msg_codec implementations.

Msg_codec::Msg_codec(flow::log::Logger* logger_ptr, const Codec_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_config(config)
{
  // That's all.
}

const Codec_config& Msg_codec::config() const
{
  return m_config;
}

void Msg_codec::encode(const Envelope& msg, flow::util::Blob* target, Error_code* err_code) const
{
  using flow::util::Blob;
  using Word = ::capnp::word;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { encode(msg, target, actual_err_code); },
         err_code, "glproxy::transport::Msg_codec::encode()"))
  {
    return;
  }
  // If got here: err_code is not null.

  Segment_builder builder(get_logger(), m_config.m_segment_sz);
  auto root = builder.initRoot<schema::Envelope>();
  root.setRequesterId(msg.m_requester_id);

  if (!encode_body(msg.m_body, root.getBody()))
  {
    FLOW_LOG_WARNING("Msg_codec [" << this << "]: Cannot encode message [" << msg << "]: it contains a "
                     "non-transferable value (owner-side object).  Such values must be replaced by handle "
                     "references before transport.  Emitting error.");
    *err_code = error::Code::S_SERIALIZE_NON_TRANSFERABLE_VALUE;
    return;
  }
  // else

  const auto max_seg_sz = builder.max_filled_segment_sz();
  if (max_seg_sz > m_config.m_segment_sz)
  {
    FLOW_LOG_WARNING("Msg_codec [" << this << "]: Cannot encode message [" << msg << "]: a serialization segment "
                     "sized [" << max_seg_sz << "] exceeded limit [" << m_config.m_segment_sz << "] (too-large "
                     "leaf value?).  Emitting error.");
    *err_code = error::Code::S_SERIALIZE_LEAF_TOO_BIG;
    return;
  }
  // else

  const size_t n_bytes = ::capnp::computeSerializedSizeInWords(builder) * sizeof(Word);
  Blob serialization(get_logger(), n_bytes);
  kj::ArrayOutputStream stream(kj::arrayPtr(serialization.begin(), serialization.size()));
  ::capnp::writeMessage(stream, builder);

  FLOW_LOG_TRACE("Msg_codec [" << this << "]: Encoded message [" << msg << "] into [" << n_bytes << "] bytes "
                 "over [" << builder.n_segments() << "] segments.");

  *target = std::move(serialization);
  err_code->clear();
} // Msg_codec::encode()

void Msg_codec::decode(const flow::util::Blob& serialization, Envelope* target, Error_code* err_code) const
{
  using Word = ::capnp::word;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { decode(serialization, target, actual_err_code); },
         err_code, "glproxy::transport::Msg_codec::decode()"))
  {
    return;
  }
  // If got here: err_code is not null.

  const size_t n_bytes = serialization.size();
  if (n_bytes == 0)
  {
    FLOW_LOG_WARNING("Msg_codec [" << this << "]: Cannot decode empty serialization.  Emitting error.");
    *err_code = error::Code::S_DESERIALIZE_FAILED_INSUFFICIENT_SEGMENTS;
    return;
  }
  if ((n_bytes % sizeof(Word)) != 0)
  {
    FLOW_LOG_WARNING("Msg_codec [" << this << "]: Cannot decode serialization sized [" << n_bytes << "]: "
                     "not a multiple of word size [" << sizeof(Word) << "].  Emitting error.");
    *err_code = error::Code::S_DESERIALIZE_FAILED_SEGMENT_MISALIGNED;
    return;
  }
  // else

  /* capnp wants word-aligned input; Blob gives no such promise.  Copy it; these messages are small, and the copy is
   * linear in size anyway as is the decode proper. */
  auto words = kj::heapArray<Word>(n_bytes / sizeof(Word));
  std::memcpy(words.begin(), serialization.const_data(), n_bytes);

  ::capnp::ReaderOptions options;
  options.traversalLimitInWords = m_config.m_traversal_limit_words;

  Envelope result;
  bool ok;
  try
  {
    ::capnp::FlatArrayMessageReader reader(words.asPtr(), options);
    const auto root = reader.getRoot<schema::Envelope>();

    FLOW_LOG_TRACE("Msg_codec [" << this << "]: Decoding [" << n_bytes << "] bytes: "
                   "[" << ostreamable_capnp_brief(root) << "].");

    result.m_requester_id = root.getRequesterId();
    ok = (result.m_requester_id != 0) && decode_body(root.getBody(), &result.m_body);
  }
  catch (const kj::Exception& exc)
  {
    FLOW_LOG_WARNING("Msg_codec [" << this << "]: capnp refused to traverse serialization sized [" << n_bytes << "]: "
                     "[" << exc.getDescription().cStr() << "].");
    ok = false;
  }

  if (!ok)
  {
    FLOW_LOG_WARNING("Msg_codec [" << this << "]: Serialization sized [" << n_bytes << "] does not decode into a "
                     "well-formed message.  Emitting error.");
    *err_code = error::Code::S_PROTOCOL_MALFORMED_MESSAGE;
    return;
  }
  // else

  *target = std::move(result);
  err_code->clear();
} // Msg_codec::decode()

} // namespace glproxy::transport
