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
#include "glproxy/transport/value.hpp"
#include <ostream>

namespace glproxy::transport
{

// Resource_object implementations.

Resource_object::~Resource_object() = default;

std::string Resource_object::type_name() const // Virtual.
{
  return "object";
}

// Free function implementations.

bool operator==(const Handle_ref& val1, const Handle_ref& val2)
{
  return val1.m_handle_id == val2.m_handle_id;
}

bool operator!=(const Handle_ref& val1, const Handle_ref& val2)
{
  return !(val1 == val2);
}

bool operator<(const Handle_ref& val1, const Handle_ref& val2)
{
  return val1.m_handle_id < val2.m_handle_id;
}

bool is_transferable(const Value& val)
{
  return !std::holds_alternative<Object_ptr>(val);
}

bool is_primitive(const Value& val)
{
  return !(std::holds_alternative<Object_ptr>(val) || std::holds_alternative<Handle_ref>(val));
}

std::ostream& operator<<(std::ostream& os, const Handle_ref& val)
{
  return os << "handle#" << val.m_handle_id;
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
  constexpr size_t MAX_TEXT_SZ = 64;

  std::visit([&](const auto& alt)
  {
    using Alt = std::decay_t<decltype(alt)>;

    if constexpr(std::is_same_v<Alt, std::monostate>)
    {
      os << "none";
    }
    else if constexpr(std::is_same_v<Alt, bool>)
    {
      os << (alt ? "true" : "false");
    }
    else if constexpr(std::is_same_v<Alt, std::string>)
    {
      if (alt.size() > MAX_TEXT_SZ)
      {
        os << '"' << String_view(alt.data(), MAX_TEXT_SZ) << "...\"";
      }
      else
      {
        os << '"' << alt << '"';
      }
    }
    else if constexpr(std::is_same_v<Alt, Bytes>)
    {
      os << "bytes[" << alt.size() << ']';
    }
    else if constexpr(std::is_same_v<Alt, Object_ptr>)
    {
      if (alt)
      {
        os << alt->type_name() << '@' << static_cast<const void*>(alt.get());
      }
      else
      {
        os << "null-object";
      }
    }
    else
    {
      os << alt; // int64_t, double, Handle_ref.
    }
  }, val);

  return os;
} // operator<<(Value)

std::ostream& operator<<(std::ostream& os, const Value_list& val)
{
  os << '(';
  for (size_t idx = 0; idx != val.size(); ++idx)
  {
    if (idx != 0)
    {
      os << ", ";
    }
    os << val[idx];
  }
  return os << ')';
}

} // namespace glproxy::transport
