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

#include "glproxy/owner/owner_fwd.hpp"
#include "glproxy/transport/protocol.hpp"
#include <map>
#include <optional>
#include <utility>

namespace glproxy::owner
{

// Types.

/**
 * Per-requester record of the requests that set *sticky* resource state, i.e., state that other requesters'
 * execution against the same resource may clobber between frames:
 *   - the mode-setter: only the most recent such request (e.g., the last `useProgram`);
 *   - targeted setters: the most recent request per (operation name, first argument) (e.g., the last
 *     `bindBuffer` per buffer target).
 *
 * At most one entry per key; always the most recently recorded request for that key.  Requests are stored as
 * received (handle references unresolved), so a replay resolves them afresh.
 *
 * Not thread-safe; the owner thread is the only user.
 */
class Sticky_state_cache
{
public:
  // Types.

  /// Key of a targeted setter: operation name and its first argument (none if it had no arguments), normalized.
  using Binding_key = std::pair<std::string, transport::Value>;

  // Methods.

  /**
   * Records the given mode-setter request, replacing any previous one.
   *
   * @param req
   *        Request.
   */
  void record_mode_setter(const transport::Request& req);

  /**
   * Records the given targeted-setter request, replacing any previous one with the same key.  A first argument
   * that is a whole-valued double is keyed as the equal integer; a NaN one names no target, so nothing is recorded.
   *
   * @param req
   *        Request.
   * @return `false` if and only if not recorded (NaN first argument).
   */
  bool record_targeted_setter(const transport::Request& req);

  /**
   * The requests to replay at the start of a frame: the mode-setter (if any) first, then each targeted setter.
   * Each is marked as not wanting a response.
   *
   * @return See above.
   */
  std::vector<transport::Request> replay_list() const;

  /**
   * The recorded mode-setter, if any.
   * @return See above.
   */
  const std::optional<transport::Request>& mode_setter() const;

  /**
   * The recorded targeted setters.
   * @return See above.
   */
  const std::map<Binding_key, transport::Request>& bindings() const;

private:
  // Data.

  /// See mode_setter().
  std::optional<transport::Request> m_mode_setter;

  /// See bindings().
  std::map<Binding_key, transport::Request> m_bindings;
}; // class Sticky_state_cache

} // namespace glproxy::owner
