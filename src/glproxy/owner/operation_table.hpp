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
#include "glproxy/transport/protocol.hpp"
#include <flow/error/error.hpp>
#include <map>
#include <utility>

namespace glproxy::owner
{

// Types.

/**
 * The owner resource's callable surface: a registry mapping each operation name to a closure, plus the named
 * constants requesters may reference.  The owning application populates it before any requester is added;
 * from then on it is only read (from the owner thread).
 *
 * An operation receives its arguments with every transport::Handle_ref already replaced by the object it refers
 * to, and returns a primitive (transferable as-is), an object (which the caller swaps for a handle), or none.
 * It may throw: a `boost::system::system_error` carrying an error::Code is reported as that code; any other
 * exception as error::Code::S_OPERATION_FAILED.
 *
 * Typed registration converts for you:
 *
 *   ~~~
 *   table.add_typed<void, int64_t, int64_t>("bindTexture", [&](int64_t target, int64_t tex) { ... });
 *   table.add_typed<Program_ptr>("createProgram", [&]() { return boost::make_shared<Program>(); });
 *   ~~~
 */
class Operation_table
{
public:
  // Types.

  /// An operation: resolved arguments in, result out.
  using Operation = Function<transport::Value (transport::Value_list& args)>;

  // Methods.

  /**
   * Registers (or replaces) an operation.
   *
   * @param name
   *        Operation name; not empty.
   * @param op
   *        The closure.
   */
  void add(const std::string& name, Operation&& op);

  /**
   * Registers (or replaces) an operation given as a typed functor: arguments are extracted via
   * transport::value_cast() and the result converted via transport::to_value() (none for `void`).  A wrong
   * argument count or type makes the operation throw with error::Code::S_ARGUMENT_TYPE_MISMATCH.
   *
   * @tparam Ret
   *         Functor's return type.
   * @tparam Args
   *         Functor's parameter types (decayed).
   * @tparam Func
   *         Functor type.
   * @param name
   *        Operation name; not empty.
   * @param func
   *        The functor.
   */
  template<typename Ret, typename... Args, typename Func>
  void add_typed(const std::string& name, Func&& func);

  /**
   * Registers (or replaces) a named constant.
   *
   * @param name
   *        Constant name.
   * @param val
   *        Its value; must be transferable.
   */
  void add_constant(const std::string& name, const transport::Value& val);

  /**
   * Looks up an operation.
   *
   * @param name
   *        Operation name.
   * @return Pointer to the closure; null if no such operation.
   */
  const Operation* find(const std::string& name) const;

  /**
   * All operation names, sorted.
   * @return See above.
   */
  std::vector<std::string> names() const;

  /**
   * All constants.
   * @return See above.
   */
  const std::map<std::string, transport::Value>& constants() const;

  /**
   * The Bootstrap message body advertising `*this`.
   * @return See above.
   */
  transport::Bootstrap to_bootstrap() const;

private:
  // Methods.

  /**
   * Calls `func` with `args` converted to `Args...` and converts the result.
   *
   * @tparam Ret
   *         See add_typed().
   * @tparam Args
   *         See add_typed().
   * @tparam Func
   *         See add_typed().
   * @tparam IDX
   *         0, 1, ..., `sizeof...(Args) - 1`.
   * @param func
   *        Functor.
   * @param args
   *        Resolved arguments.
   * @return See above.
   */
  template<typename Ret, typename... Args, typename Func, size_t... IDX>
  static transport::Value invoke_typed(Func& func, transport::Value_list& args, std::index_sequence<IDX...>);

  // Data.

  /// Operations by name.
  std::map<std::string, Operation> m_operations;

  /// Constants by name.
  std::map<std::string, transport::Value> m_constants;
}; // class Operation_table

// Template implementations.

template<typename Ret, typename... Args, typename Func>
void Operation_table::add_typed(const std::string& name, Func&& func)
{
  add(name, [func = std::forward<Func>(func)](transport::Value_list& args) mutable -> transport::Value
  {
    return invoke_typed<Ret, Args...>(func, args, std::index_sequence_for<Args...>());
  });
}

template<typename Ret, typename... Args, typename Func, size_t... IDX>
transport::Value Operation_table::invoke_typed(Func& func, transport::Value_list& args, std::index_sequence<IDX...>)
{
  using transport::value_cast;

  if (args.size() != sizeof...(Args))
  {
    throw flow::error::Runtime_error(error::Code::S_ARGUMENT_TYPE_MISMATCH,
                                     "glproxy::owner::Operation_table::invoke_typed(): argument count");
  }
  // else: value_cast() throws on type mismatch.

  if constexpr(std::is_void_v<Ret>)
  {
    func(value_cast<std::decay_t<Args>>(args[IDX])...);
    return transport::Value();
  }
  else
  {
    return transport::to_value(func(value_cast<std::decay_t<Args>>(args[IDX])...));
  }
} // Operation_table::invoke_typed()

} // namespace glproxy::owner
