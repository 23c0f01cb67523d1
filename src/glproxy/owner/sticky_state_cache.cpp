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
#include "glproxy/owner/sticky_state_cache.hpp"
#include <cmath>

namespace glproxy::owner
{

void Sticky_state_cache::record_mode_setter(const transport::Request& req)
{
  m_mode_setter = req;
}

bool Sticky_state_cache::record_targeted_setter(const transport::Request& req)
{
  auto target = req.m_args.empty() ? transport::Value() : req.m_args.front();

  // A whole-valued double names the same target as the integer: 34962.0 is 34962.
  if (const auto real = std::get_if<double>(&target))
  {
    if (std::isnan(*real))
    {
      return false;
    }
    // else
    constexpr double INT64_BOUND = 9223372036854775808.0; // 2^63.
    if ((std::trunc(*real) == *real) && (*real >= -INT64_BOUND) && (*real < INT64_BOUND))
    {
      target = transport::to_value(static_cast<int64_t>(*real));
    }
  }

  m_bindings.insert_or_assign(Binding_key(req.m_name, std::move(target)), req);
  return true;
}

std::vector<transport::Request> Sticky_state_cache::replay_list() const
{
  std::vector<transport::Request> result;
  result.reserve(m_bindings.size() + 1);

  if (m_mode_setter)
  {
    result.push_back(*m_mode_setter);
  }
  for (const auto& key_and_req : m_bindings)
  {
    result.push_back(key_and_req.second);
  }

  for (auto& req : result)
  {
    req.m_wants_response = false;
  }
  return result;
}

const std::optional<transport::Request>& Sticky_state_cache::mode_setter() const
{
  return m_mode_setter;
}

const std::map<Sticky_state_cache::Binding_key, transport::Request>& Sticky_state_cache::bindings() const
{
  return m_bindings;
}

} // namespace glproxy::owner
