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
#include "test_common.hpp"
#include "glproxy/owner/handle_registry.hpp"
#include "glproxy/owner/result_trace.hpp"
#include <boost/make_shared.hpp>
#include <gtest/gtest.h>
#include <algorithm>

namespace glproxy::owner::test
{

using glproxy::test::Test_resource;
using glproxy::test::Test_texture;
using transport::Value;
using transport::Value_list;
using transport::to_value;

TEST(Operation_table, Lookup_and_bootstrap)
{
  const Test_resource resource;
  const auto& ops = resource.operations();

  EXPECT_TRUE(ops.find("draw"));
  EXPECT_FALSE(ops.find("noSuchThing"));

  const auto names = ops.names();
  EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
  EXPECT_NE(std::find(names.begin(), names.end(), "useProgram"), names.end());

  const auto bootstrap = ops.to_bootstrap();
  EXPECT_EQ(bootstrap.m_operation_names, names);
  ASSERT_EQ(bootstrap.m_constants.count("MAX_TEXTURE_SIZE"), 1u);
  EXPECT_EQ(bootstrap.m_constants.at("MAX_TEXTURE_SIZE"), to_value(4096));
}

TEST(Operation_table, Typed_invocation)
{
  Test_resource resource;
  const auto& ops = resource.operations();

  Value_list args{ to_value(5) };
  EXPECT_EQ((*ops.find("useProgram"))(args), Value());
  EXPECT_EQ(resource.m_program, 5);

  Value_list no_args;
  EXPECT_EQ((*ops.find("currentProgram"))(no_args), to_value(5));

  const auto tex = (*ops.find("createTexture"))(no_args);
  ASSERT_TRUE(std::holds_alternative<transport::Object_ptr>(tex));
  Value_list tex_args{ tex };
  EXPECT_EQ((*ops.find("textureId"))(tex_args), to_value(1));
}

TEST(Operation_table, Argument_mismatch_throws)
{
  Test_resource resource;
  const auto& ops = resource.operations();

  Value_list too_few;
  try
  {
    (*ops.find("useProgram"))(too_few);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_ARGUMENT_TYPE_MISMATCH);
  }

  Value_list wrong_type{ to_value("five") };
  EXPECT_THROW((*ops.find("useProgram"))(wrong_type), flow::error::Runtime_error);
  EXPECT_EQ(resource.m_program, 0);
}

TEST(Handle_registry, Insert_resolve_release)
{
  Handle_registry registry;
  const auto tex1 = boost::make_shared<Test_texture>(1);
  const auto tex2 = boost::make_shared<Test_texture>(2);

  const auto handle1 = registry.insert(tex1);
  const auto handle2 = registry.insert(tex2);
  EXPECT_NE(handle1.m_handle_id, 0u);
  EXPECT_NE(handle1, handle2);
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_EQ(registry.resolve(handle2.m_handle_id), tex2);

  EXPECT_TRUE(registry.release(handle1.m_handle_id));
  EXPECT_FALSE(registry.release(handle1.m_handle_id));
  EXPECT_FALSE(registry.resolve(handle1.m_handle_id));
  EXPECT_FALSE(registry.resolve(0));

  // IDs are never reused.
  const auto handle3 = registry.insert(tex1);
  EXPECT_NE(handle3, handle1);
  EXPECT_NE(handle3, handle2);
}

TEST(Result_trace, Records_per_operation)
{
  Result_trace trace;
  trace.record("boundBuffer", Value_list{ to_value(1) }, to_value(10));
  trace.record("boundBuffer", Value_list{ to_value(2) }, to_value(20));
  trace.record("currentProgram", Value_list(), to_value(3));

  EXPECT_EQ(trace.size(), 3u);
  ASSERT_EQ(trace.entries("boundBuffer").size(), 2u);
  EXPECT_EQ(trace.entries("boundBuffer")[1].m_args, Value_list{ to_value(2) });
  EXPECT_EQ(trace.entries("boundBuffer")[1].m_result, to_value(20));
  EXPECT_TRUE(trace.entries("draw").empty());
}

} // namespace glproxy::owner::test
