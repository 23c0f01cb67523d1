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
 * The requester-context side: issues operations against the owner's resource, which it cannot touch directly.
 *
 * Requester connects to the owner over a transport::Msg_channel.  Once the owner's Bootstrap arrives,
 * Requester::stub() hands out a Call_stub per advertised operation; invoking one sends a Request and returns a
 * Completion, which resolves when the matching Reply arrives.  On each Frame_begin the user's frame handler runs,
 * after which Requester tells the owner the frame's requests are all in (Frame_end).
 */
namespace glproxy::requester
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Requester_config;
class Requester;
class Call_stub;
struct Call_result;
class Completion;

} // namespace glproxy::requester
