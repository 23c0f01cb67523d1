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
#include <capnp/pretty-print.h>
#include <kj/string.h>
#include <ostream>

namespace glproxy::transport
{

// Types.

/**
 * Proxy object referring to a capnp `Reader` for straightforward output via overloaded `ostream<<`:
 * one-line/potentially-truncated form.
 * To construct one pithily please use ostreamable_capnp_brief() free function.
 * If you have a `Builder` to print use `.asReader()` on it inside parentheses of that call.
 */
template<typename Capnp_reader>
struct Ostreamable_capnp_brief
{
  // Data.
  /// The encapsulated `Reader`.
  const Capnp_reader& m_capnp_reader;
};

// Free functions.

/**
 * Convenience function that returns an object passable to `ostream<<` to print a
 * one-line/potentially-truncated representation to that stream, given an arbitrary capnp `Reader`.
 *
 * @param capnp_reader
 *        The `Reader` to presumably print.
 * @return See above.
 */
template<typename Capnp_reader>
Ostreamable_capnp_brief<Capnp_reader> ostreamable_capnp_brief(const Capnp_reader& capnp_reader)
{
  return Ostreamable_capnp_brief<Capnp_reader>{ capnp_reader };
}

/**
 * Prints string representation (one-line/potentially-truncated form) of the given capnp `Reader`, via proxy object,
 * to the given `ostream`.
 *
 * @warning Potentially the entire underlying capnp tree shall be traversed to make the output work
 *          (even if ultimately the output is truncated for length).  This can be quite slow.  Use only
 *          when TRACE-logging is enabled.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Capnp_reader>
std::ostream& operator<<(std::ostream& os, const Ostreamable_capnp_brief<Capnp_reader>& val)
{
  using kj::str;
  using kj::String;

  constexpr size_t MAX_SZ = 256;
  constexpr String_view TRUNC_SUFFIX = "... )"; // Fake the end to look like the end of the real pretty-print.
  const String capnp_str = str(val.m_capnp_reader);
  if (capnp_str.size() > MAX_SZ)
  {
    return os << String_view(capnp_str.begin(), MAX_SZ - TRUNC_SUFFIX.size()) << TRUNC_SUFFIX;
  }
  // else
  return os << capnp_str.cStr();
}

} // namespace glproxy::transport
