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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/util/string_view.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/**
 * Catch-all namespace for the glproxy project: a remote command proxy letting several isolated *requester*
 * contexts invoke operations against one stateful resource living exclusively in an *owner* context.
 *
 * The sub-namespaces, leaves first:
 *   - glproxy::error: error codes (boost.system-style) issued by everything else.
 *   - glproxy::transport: values that may cross the context boundary, protocol messages, their capnp codec,
 *     the blob links that carry them, and transport::Msg_channel which ties those together.
 *   - glproxy::requester: requester-context side; its big daddy is requester::Requester, which hands out
 *     `Call_stub`s (one per operation the owner advertised).
 *   - glproxy::owner: owner-context side; owner::Command_proxy (one per requester) applies requests to the
 *     resource surface (owner::Operation_table), and owner::Frame_coordinator drives the per-frame cycle.
 */
namespace glproxy
{

// Types.

/// Short-hand for the boost.system error code type used throughout.
using Error_code = flow::Error_code;

/// Short-hand for the high-precision duration type used for timeouts.
using Fine_duration = flow::Fine_duration;

/// Short-hand for polymorphic function object.
template<typename Signature>
using Function = flow::Function<Signature>;

/// Short-hand for string view type compatible with Flow APIs.
using String_view = flow::util::String_view;

/**
 * The `flow::log` component enumeration for all glproxy logging.  Register with
 * `flow::log::Config::init_component_to_union_idx_mapping<Log_component>()` and
 * `init_component_names<Log_component>(S_GLPROXY_LOG_COMPONENT_NAME_MAP)` to get names in the log output.
 */
enum class Log_component
{
  /// Uncategorized; e.g., test programs.
  S_UNCAT = 0,
  /// transport::Msg_channel, blob links, codec.
  S_TRANSPORT,
  /// requester::Requester and friends.
  S_REQUESTER,
  /// owner::Command_proxy, owner::Frame_coordinator and friends.
  S_OWNER,
  /// SENTINEL: Not a component.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

/// Map from each #Log_component to its name, suitable for `flow::log::Config::init_component_names()`.
extern const boost::unordered_multimap<Log_component, std::string> S_GLPROXY_LOG_COMPONENT_NAME_MAP;

} // namespace glproxy
