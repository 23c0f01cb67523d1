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

/**
 * The owner-context side: the one place where the shared resource lives and is mutated.
 *
 * Leaves first:
 *   - Operation_table: the resource's callable surface (name => closure) and its named constants.
 *   - Handle_registry: handle ID => non-transferable result object, per requester.
 *   - Sticky_state_cache: the last mode-setter and targeted-setter requests, per requester, replayed at the
 *     start of each frame.
 *   - Result_trace: diagnostic record of primitive results.
 *   - Command_proxy: one per requester; executes or buffers that requester's requests against the resource.
 *   - Frame_coordinator: owns the owner thread and drives the collect-all-then-flush-all frame cycle across
 *     every Command_proxy.
 */
namespace glproxy::owner
{

// Types.

// Find doc headers near the bodies of these compound types.

class Operation_table;
class Handle_registry;
class Sticky_state_cache;
class Result_trace;
struct Proxy_config;
class Command_proxy;
struct Coordinator_config;
class Frame_coordinator;

} // namespace glproxy::owner
