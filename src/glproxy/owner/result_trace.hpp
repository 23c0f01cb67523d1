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
#include "glproxy/transport/value.hpp"
#include <map>

namespace glproxy::owner
{

// Types.

/**
 * Per-requester, per-operation, append-only record of {arguments, result} of each call that returned a
 * primitive (other than none).  Purely diagnostic: nothing consults it to decide whether or how to execute.
 *
 * Not thread-safe; the owner thread is the only user.
 */
class Result_trace
{
public:
  // Types.

  /// One recorded call.
  struct Entry
  {
    // Data.

    /// Arguments as received (handle references unresolved).
    transport::Value_list m_args;

    /// The primitive result.
    transport::Value m_result;
  };

  // Methods.

  /**
   * Appends an entry for the given operation.
   *
   * @param name
   *        Operation name.
   * @param args
   *        See Entry.
   * @param result
   *        See Entry.
   */
  void record(const std::string& name, const transport::Value_list& args, const transport::Value& result);

  /**
   * Entries recorded for the given operation, oldest first.
   *
   * @param name
   *        Operation name.
   * @return See above.  Empty if none.
   */
  const std::vector<Entry>& entries(const std::string& name) const;

  /**
   * Total number of entries.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// Entries per operation name.
  std::map<std::string, std::vector<Entry>> m_entries;

  /// See size().
  size_t m_size = 0;
}; // class Result_trace

} // namespace glproxy::owner
