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
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <stdexcept>

namespace glproxy::test
{

Test_texture::Test_texture(int64_t id) :
  m_id(id)
{
  // Nothing else.
}

std::string Test_texture::type_name() const // Virtual.
{
  return "texture";
}

Test_resource::Test_resource() :
  m_program(0),
  m_next_texture_id(1)
{
  using transport::to_value;
  using Texture_ptr = boost::shared_ptr<Test_texture>;

  m_operations.add_typed<void, int64_t>("useProgram", [this](int64_t program)
  {
    m_call_log.push_back("useProgram");
    m_program = program;
  });
  m_operations.add_typed<void, int64_t, int64_t>("bindBuffer", [this](int64_t target, int64_t id)
  {
    m_call_log.push_back("bindBuffer");
    m_buffers[target] = id;
  });
  m_operations.add_typed<void, int64_t, int64_t>("bindTexture", [this](int64_t target, int64_t id)
  {
    m_call_log.push_back("bindTexture");
    m_textures[target] = id;
  });
  m_operations.add_typed<void>("clear", [this]()
  {
    m_call_log.push_back("clear");
    m_framebuffer.clear();
  });
  m_operations.add_typed<void, int64_t>("draw", [this](int64_t value)
  {
    m_call_log.push_back("draw");
    m_framebuffer.push_back(value);
  });
  m_operations.add_typed<Texture_ptr>("createTexture", [this]()
  {
    m_call_log.push_back("createTexture");
    m_created_textures.push_back(boost::make_shared<Test_texture>(m_next_texture_id++));
    return m_created_textures.back();
  });
  m_operations.add_typed<int64_t, Texture_ptr>("textureId", [this](const Texture_ptr& texture)
  {
    m_call_log.push_back("textureId");
    m_last_texture_arg = texture;
    return texture->m_id;
  });
  m_operations.add_typed<int64_t>("currentProgram", [this]()
  {
    m_call_log.push_back("currentProgram");
    return m_program;
  });
  m_operations.add_typed<int64_t, int64_t>("boundBuffer", [this](int64_t target)
  {
    m_call_log.push_back("boundBuffer");
    const auto it = m_buffers.find(target);
    return (it == m_buffers.end()) ? int64_t(0) : it->second;
  });
  m_operations.add_typed<void>("fail", [this]()
  {
    m_call_log.push_back("fail");
    throw std::runtime_error("Resource is unhappy.");
  });
  m_operations.add_typed<void>("failWithCode", [this]()
  {
    m_call_log.push_back("failWithCode");
    throw flow::error::Runtime_error(error::Code::S_ARGUMENT_TYPE_MISMATCH, "failWithCode()");
  });
  m_operations.add_constant("MAX_TEXTURE_SIZE", to_value(4096));
} // Test_resource::Test_resource()

const owner::Operation_table& Test_resource::operations() const
{
  return m_operations;
}

void Test_resource::present()
{
  m_presented.push_back(m_framebuffer);
  m_framebuffer.clear();
}

flow::log::Logger* test_logger()
{
  using flow::log::Config;
  using flow::log::Sev;
  using flow::log::Simple_ostream_logger;

  static Config s_config;
  static const bool S_CONFIGURED = []()
  {
    s_config.init_component_to_union_idx_mapping<Log_component>(1000, 999);
    s_config.init_component_names<Log_component>(S_GLPROXY_LOG_COMPONENT_NAME_MAP, false, "glproxy-");
    s_config.configure_default_verbosity(Sev::S_WARNING, true);
    return true;
  }();
  static Simple_ostream_logger s_logger(&s_config);

  static_cast<void>(S_CONFIGURED);
  return &s_logger;
}

transport::Request make_request(transport::request_id_t request_id, const std::string& name,
                                transport::Value_list&& args, bool wants_response)
{
  return transport::Request{ request_id, name, std::move(args), wants_response };
}

} // namespace glproxy::test
