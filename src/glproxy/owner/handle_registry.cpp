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
#include "glproxy/owner/handle_registry.hpp"
#include <cassert>

namespace glproxy::owner
{

Handle_registry::Handle_registry() :
  m_next_handle_id(1)
{
  // That's it.
}

transport::Handle_ref Handle_registry::insert(const transport::Object_ptr& obj)
{
  assert(obj && "Store real objects only.");

  const auto handle_id = m_next_handle_id++;
  m_objects.emplace(handle_id, obj);
  return transport::Handle_ref{ handle_id };
}

transport::Object_ptr Handle_registry::resolve(transport::handle_id_t handle_id) const
{
  const auto it = m_objects.find(handle_id);
  return (it == m_objects.end()) ? transport::Object_ptr() : it->second;
}

bool Handle_registry::release(transport::handle_id_t handle_id)
{
  return m_objects.erase(handle_id) != 0;
}

size_t Handle_registry::size() const
{
  return m_objects.size();
}

} // namespace glproxy::owner
