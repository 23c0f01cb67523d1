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
#include <gtest/gtest.h>
#include <sstream>

namespace glproxy::error::test
{

TEST(Error_code, Category_and_messages)
{
  for (int val = S_CODE_LOWEST_INT_VALUE; val != int(Code::S_END_SENTINEL); ++val)
  {
    const Error_code err_code(static_cast<Code>(val));
    EXPECT_TRUE(err_code);
    EXPECT_STREQ(err_code.category().name(), "glproxy");
    EXPECT_FALSE(err_code.message().empty()) << "Code [" << val << "] lacks a message.";
  }
  EXPECT_EQ(Error_code(Code::S_LINK_CLOSED), Error_code(Code::S_LINK_CLOSED));
  EXPECT_NE(Error_code(Code::S_LINK_CLOSED), Error_code(Code::S_REQUEST_CANCELED));
}

TEST(Error_code, Stream_symbols)
{
  std::ostringstream os;
  os << Code::S_PEER_UNRESPONSIVE;
  EXPECT_EQ(os.str(), "PEER_UNRESPONSIVE");

  Code parsed = Code::S_END_SENTINEL;
  std::istringstream is("dangling_handle_reference");
  is >> parsed;
  EXPECT_EQ(parsed, Code::S_DANGLING_HANDLE_REFERENCE);

  std::istringstream bad_is("NO_SUCH_THING");
  bad_is >> parsed;
  EXPECT_EQ(parsed, Code::S_END_SENTINEL);
}

} // namespace glproxy::error::test
