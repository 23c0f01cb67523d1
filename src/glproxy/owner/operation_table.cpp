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
#include "glproxy/owner/operation_table.hpp"
#include <cassert>

namespace glproxy::owner
{

void Operation_table::add(const std::string& name, Operation&& op)
{
  assert((!name.empty()) && "Operation name must not be empty.");
  m_operations[name] = std::move(op);
}

void Operation_table::add_constant(const std::string& name, const transport::Value& val)
{
  assert(transport::is_transferable(val) && "Constants are sent to requesters; they must be transferable.");
  m_constants[name] = val;
}

const Operation_table::Operation* Operation_table::find(const std::string& name) const
{
  const auto it = m_operations.find(name);
  return (it == m_operations.end()) ? nullptr : &it->second;
}

std::vector<std::string> Operation_table::names() const
{
  std::vector<std::string> result;
  result.reserve(m_operations.size());
  for (const auto& name_and_op : m_operations)
  {
    result.push_back(name_and_op.first);
  }
  return result;
}

const std::map<std::string, transport::Value>& Operation_table::constants() const
{
  return m_constants;
}

transport::Bootstrap Operation_table::to_bootstrap() const
{
  return transport::Bootstrap{ names(), m_constants };
}

} // namespace glproxy::owner
