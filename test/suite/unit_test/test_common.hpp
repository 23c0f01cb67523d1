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

#include "glproxy/owner/operation_table.hpp"
#include "glproxy/transport/value.hpp"
#include <flow/log/log.hpp>
#include <map>
#include <string>
#include <vector>

namespace glproxy::test
{

// Types.

/// An object result that cannot cross the context boundary.
class Test_texture :
  public transport::Resource_object
{
public:
  // Constructors/destructor.

  explicit Test_texture(int64_t id);

  // Methods.

  std::string type_name() const override;

  // Data.

  /// Owner-side ID.
  const int64_t m_id;
};

/**
 * A small stateful resource in the style of a graphics context: a current program, binding points, a
 * framebuffer that is cleared each frame, plus a log of every executed call, in execution order.
 * Its operations() must be invoked from one thread at a time.
 *
 * Operations:
 *   - `useProgram(int)`, `bindBuffer(int target, int id)`, `bindTexture(int target, int id)`;
 *   - `clear()`: empties the framebuffer;
 *   - `draw(int value)`: appends to the framebuffer;
 *   - `createTexture()`: returns a fresh Test_texture;
 *   - `textureId(texture)`: its ID;
 *   - `currentProgram()`, `boundBuffer(int target)`: current state;
 *   - `fail()`: throws `std::runtime_error`;
 *   - `failWithCode()`: throws `flow::error::Runtime_error` carrying error::Code::S_ARGUMENT_TYPE_MISMATCH.
 *
 * Constant `MAX_TEXTURE_SIZE` = 4096.
 */
class Test_resource
{
public:
  // Constructors/destructor.

  Test_resource();

  // Methods.

  /**
   * The operation table over `*this`.
   * @return See above.
   */
  const owner::Operation_table& operations() const;

  /// Presents and resets the framebuffer; for owner::Frame_coordinator.
  void present();

  // Data.

  /// Every executed call's name, in execution order.
  std::vector<std::string> m_call_log;

  /// Argument of the latest `useProgram()`.
  int64_t m_program;

  /// `bindBuffer()` state: target to ID.
  std::map<int64_t, int64_t> m_buffers;

  /// `bindTexture()` state: target to ID.
  std::map<int64_t, int64_t> m_textures;

  /// `draw()` arguments since the latest `clear()` or present().
  std::vector<int64_t> m_framebuffer;

  /// Frames presented: the framebuffer contents at each present().
  std::vector<std::vector<int64_t>> m_presented;

  /// Every `createTexture()` result, in order.
  std::vector<boost::shared_ptr<Test_texture>> m_created_textures;

  /// Argument of the latest `textureId()`.
  boost::shared_ptr<Test_texture> m_last_texture_arg;

private:
  // Data.

  /// See operations().
  owner::Operation_table m_operations;

  /// Next Test_texture ID.
  int64_t m_next_texture_id;
}; // class Test_resource

// Free functions.

/**
 * Logger for tests: console, warnings and worse.
 * @return See above.
 */
flow::log::Logger* test_logger();

/**
 * Short-hand for a request.
 *
 * @param request_id
 *        ID.
 * @param name
 *        Operation.
 * @param args
 *        Arguments.
 * @param wants_response
 *        Whether reply is due.
 * @return See above.
 */
transport::Request make_request(transport::request_id_t request_id, const std::string& name,
                                transport::Value_list&& args = transport::Value_list(),
                                bool wants_response = false);

} // namespace glproxy::test
