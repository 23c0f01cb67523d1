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

#include "glproxy/requester/completion.hpp"
#include <string>

namespace glproxy::requester
{

// Types.

/**
 * Callable standing in, on the requester side, for one operation of the owner's resource.  Obtain via
 * Requester::stub().  Arguments of any arity and of any type accepted by transport::to_value() (other than owner
 * objects, which a requester never has) are converted into a transport::Value_list and sent as one Request.
 *
 *   ~~~
 *   auto use_program = requester.stub("useProgram");
 *   auto create_program = requester.stub("createProgram");
 *   const auto program = create_program().get(); // Handle_ref.
 *   use_program.post(program);                   // Fire-and-forget.
 *   ~~~
 *
 * A Call_stub is a light value (the Requester pointer and the name); it must not outlive its Requester.
 */
class Call_stub
{
public:
  // Constructors/destructor.

  /// Constructs a stub that refers to nothing.  Invoking it is undefined behavior.
  Call_stub();

  // Methods.

  /**
   * Sends the request (wanting a response) and returns the Completion that will carry the result.
   * Failures detected locally (unknown operation, not bootstrapped, link closed) are reported via the
   * Completion too.
   *
   * @tparam Args
   *         Argument types.
   * @param args
   *        Arguments.
   * @return See above.
   */
  template<typename... Args>
  Completion operator()(Args&&... args) const;

  /**
   * Sends the request not wanting a response.  Failures detected locally are logged by Requester.
   *
   * @tparam Args
   *         Argument types.
   * @param args
   *        Arguments.
   * @return Falsy if sent (or batched for sending); else why not.
   */
  template<typename... Args>
  Error_code post(Args&&... args) const;

  /**
   * Operation name.
   * @return See above.
   */
  const std::string& name() const;

private:
  // Friends.

  /// It constructs us.
  friend class Requester;

  // Constructors.

  /**
   * Constructs the stub.
   *
   * @param requester
   *        The requester.
   * @param name
   *        Operation name.
   */
  explicit Call_stub(Requester* requester, const std::string& name);

  // Methods.

  /**
   * Non-template core of the call operators.
   *
   * @param args
   *        Converted arguments.
   * @param wants_response
   *        See transport::Request.
   * @return See Requester::issue().
   */
  Completion issue(transport::Value_list&& args, bool wants_response) const;

  // Data.

  /// The requester.
  Requester* m_requester;

  /// See name().
  std::string m_name;
}; // class Call_stub

// Template implementations.

template<typename... Args>
Completion Call_stub::operator()(Args&&... args) const
{
  return issue(transport::Value_list{ transport::to_value(std::forward<Args>(args))... }, true);
}

template<typename... Args>
Error_code Call_stub::post(Args&&... args) const
{
  Completion completion = issue(transport::Value_list{ transport::to_value(std::forward<Args>(args))... }, false);
  if (completion.valid())
  {
    // Only failures yield a Completion for a fire-and-forget call; it is resolved already.
    Error_code err_code;
    completion.get(&err_code);
    return err_code;
  }
  // else
  return Error_code();
}

} // namespace glproxy::requester
