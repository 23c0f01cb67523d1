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
#include "glproxy/error.hpp"
#include <flow/error/error.hpp>
#include <boost/pointer_cast.hpp>
#include <string_view>
#include <type_traits>

namespace glproxy::transport
{

// Types.

/**
 * Base of any owner-side object that an operation may return and that cannot be transferred to a requester:
 * a compiled program, a buffer object, and so on.  The owner keeps such objects in its owner::Handle_registry
 * and hands the requester a Handle_ref instead; when the requester passes that Handle_ref back as an argument,
 * the very same object (same address) is substituted.
 *
 * An owner resource's object types derive from this; operations return them as `boost::shared_ptr<Derived>`.
 */
class Resource_object
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Resource_object();

  // Methods.

  /**
   * Short name of the concrete object type, for logging.
   *
   * @return See above.
   */
  virtual std::string type_name() const;
}; // class Resource_object

/// Opaque token standing in for a non-transferable result; resolvable only within the owner's registry.
struct Handle_ref
{
  // Data.

  /// The handle ID; 0 is a sentinel and never refers to an object.
  handle_id_t m_handle_id;
};

// Free functions.

/**
 * Returns `true` if and only if the two refer to the same handle ID.
 *
 * @relatesalso Handle_ref
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Handle_ref& val1, const Handle_ref& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Handle_ref
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Handle_ref& val1, const Handle_ref& val2);

/**
 * Orders by handle ID, so that a #Value containing a Handle_ref can be a key in an ordered container.
 *
 * @relatesalso Handle_ref
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator<(const Handle_ref& val1, const Handle_ref& val2);

/**
 * Returns `true` if the given #Value may be encoded for transport: anything but an #Object_ptr.
 *
 * @param val
 *        Value to check.
 * @return See above.
 */
bool is_transferable(const Value& val);

/**
 * Returns `true` if the given #Value is a primitive: none, boolean, integer, real, text or bytes.
 * (A Handle_ref is transferable but not primitive; an #Object_ptr is neither.)
 *
 * @param val
 *        Value to check.
 * @return See above.
 */
bool is_primitive(const Value& val);

/**
 * Converts a C++ value into a #Value, choosing the alternative by type category rather than by
 * `variant` overload resolution: `bool` => boolean; any other integral or `enum` type => integer;
 * floating-point => real; anything convertible to `std::string_view` => text; #Bytes => bytes;
 * Handle_ref => handle; `boost::shared_ptr<T>` with `T` derived from Resource_object => #Object_ptr;
 * a #Value => itself.
 *
 * @tparam T
 *         See above.
 * @param val
 *        Value to convert.
 * @return See above.
 */
template<typename T>
Value to_value(T&& val);

/**
 * The opposite of to_value(): extracts a `T` out of a #Value, with the same type-category mapping.
 * An integer #Value is accepted for a floating-point `T` (but not the other way around).
 * For `T` = `boost::shared_ptr<X>` the object is down-cast to `X`, which must match.
 *
 * @tparam T
 *         Target type.
 * @param val
 *        Value to convert.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_ARGUMENT_TYPE_MISMATCH.
 * @return The extracted value; or a default-constructed `T` on error.
 */
template<typename T>
T value_cast(const Value& val, Error_code* err_code = 0);

// Template implementations.

template<typename T>
Value to_value(T&& val)
{
  using Plain = std::decay_t<T>;

  if constexpr(std::is_same_v<Plain, Value>)
  {
    return Value(std::forward<T>(val));
  }
  else if constexpr(std::is_same_v<Plain, std::monostate>)
  {
    return Value();
  }
  else if constexpr(std::is_same_v<Plain, bool>)
  {
    return Value(std::in_place_type<bool>, val);
  }
  else if constexpr(std::is_integral_v<Plain> || std::is_enum_v<Plain>)
  {
    return Value(std::in_place_type<int64_t>, static_cast<int64_t>(val));
  }
  else if constexpr(std::is_floating_point_v<Plain>)
  {
    return Value(std::in_place_type<double>, static_cast<double>(val));
  }
  else if constexpr(std::is_same_v<Plain, Bytes>)
  {
    return Value(std::in_place_type<Bytes>, std::forward<T>(val));
  }
  else if constexpr(std::is_same_v<Plain, Handle_ref>)
  {
    return Value(std::in_place_type<Handle_ref>, val);
  }
  else if constexpr(std::is_convertible_v<const Plain&, std::string_view>)
  {
    const std::string_view view(val);
    return Value(std::in_place_type<std::string>, view.begin(), view.end());
  }
  else
  {
    // Must be shared_ptr<Resource_object-derived>; the conversion below will not compile otherwise.
    return Value(std::in_place_type<Object_ptr>, Object_ptr(std::forward<T>(val)));
  }
} // to_value()

template<typename T>
T value_cast(const Value& val, Error_code* err_code)
{
  using std::get_if;

  T result{};
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { result = value_cast<T>(val, actual_err_code); },
         err_code, "glproxy::transport::value_cast()"))
  {
    return result;
  }
  // else
  err_code->clear();

  if constexpr(std::is_same_v<T, Value>)
  {
    return val;
  }
  else if constexpr(std::is_same_v<T, bool>)
  {
    if (const auto ptr = get_if<bool>(&val))
    {
      return *ptr;
    }
  }
  else if constexpr(std::is_integral_v<T> || std::is_enum_v<T>)
  {
    if (const auto ptr = get_if<int64_t>(&val))
    {
      return static_cast<T>(*ptr);
    }
  }
  else if constexpr(std::is_floating_point_v<T>)
  {
    if (const auto ptr = get_if<double>(&val))
    {
      return static_cast<T>(*ptr);
    }
    if (const auto ptr = get_if<int64_t>(&val))
    {
      return static_cast<T>(*ptr);
    }
  }
  else if constexpr(std::is_same_v<T, std::string>)
  {
    if (const auto ptr = get_if<std::string>(&val))
    {
      return *ptr;
    }
  }
  else if constexpr(std::is_same_v<T, Bytes>)
  {
    if (const auto ptr = get_if<Bytes>(&val))
    {
      return *ptr;
    }
  }
  else if constexpr(std::is_same_v<T, Handle_ref>)
  {
    if (const auto ptr = get_if<Handle_ref>(&val))
    {
      return *ptr;
    }
  }
  else
  {
    // T is boost::shared_ptr<X>.  Null object pointer is a mismatch too.
    if (const auto ptr = get_if<Object_ptr>(&val))
    {
      auto obj = boost::dynamic_pointer_cast<typename T::element_type>(*ptr);
      if (obj)
      {
        return obj;
      }
    }
  }

  *err_code = error::Code::S_ARGUMENT_TYPE_MISMATCH;
  return T{};
} // value_cast()

} // namespace glproxy::transport
