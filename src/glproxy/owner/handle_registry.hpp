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
#include <boost/unordered_map.hpp>

namespace glproxy::owner
{

// Types.

/**
 * Arena of non-transferable objects handed out to one requester by reference: handle ID => object.
 * IDs are allocated from a counter (1, 2, ...) of its own, never reused; an entry lives until release()d
 * (or until `*this` is destroyed).  Resolving a handle yields the very object stored (same pointer), not a copy.
 *
 * Not thread-safe; the owner thread is the only user.
 */
class Handle_registry
{
public:
  // Constructors/destructor.

  /// Constructs an empty registry.
  Handle_registry();

  // Methods.

  /**
   * Stores the object under a fresh handle ID.
   *
   * @param obj
   *        Object; not null.
   * @return Reference to it.
   */
  transport::Handle_ref insert(const transport::Object_ptr& obj);

  /**
   * Returns the object stored under the given ID.
   *
   * @param handle_id
   *        Handle ID.
   * @return The object; null if none (never stored or released).
   */
  transport::Object_ptr resolve(transport::handle_id_t handle_id) const;

  /**
   * Forgets the object stored under the given ID.
   *
   * @param handle_id
   *        Handle ID.
   * @return `false` if there was no such entry.
   */
  bool release(transport::handle_id_t handle_id);

  /**
   * Number of live entries.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// Next ID to hand out.
  transport::handle_id_t m_next_handle_id;

  /// The entries.
  boost::unordered_map<transport::handle_id_t, transport::Object_ptr> m_objects;
}; // class Handle_registry

} // namespace glproxy::owner
