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
#include "glproxy/owner/sticky_state_cache.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace glproxy::owner::test
{

using glproxy::test::make_request;
using transport::to_value;

TEST(Sticky_state_cache, Latest_mode_setter_wins)
{
  Sticky_state_cache cache;
  EXPECT_TRUE(cache.replay_list().empty());

  cache.record_mode_setter(make_request(1, "useProgram", { to_value(3) }, true));
  cache.record_mode_setter(make_request(2, "useProgram", { to_value(4) }));

  const auto replays = cache.replay_list();
  ASSERT_EQ(replays.size(), 1u);
  EXPECT_EQ(replays[0].m_args.front(), to_value(4));
}

TEST(Sticky_state_cache, Bindings_keyed_by_name_and_target)
{
  Sticky_state_cache cache;
  cache.record_targeted_setter(make_request(1, "bindBuffer", { to_value(34962), to_value(1) }));
  cache.record_targeted_setter(make_request(2, "bindBuffer", { to_value(34963), to_value(2) }));
  cache.record_targeted_setter(make_request(3, "bindBuffer", { to_value(34962), to_value(5) })); // Replaces #1.
  cache.record_targeted_setter(make_request(4, "bindTexture", { to_value(34962), to_value(9) }));
  cache.record_mode_setter(make_request(5, "useProgram", { to_value(7) }, true));

  EXPECT_EQ(cache.bindings().size(), 3u);

  const auto replays = cache.replay_list();
  ASSERT_EQ(replays.size(), 4u);
  EXPECT_EQ(replays[0].m_name, "useProgram"); // Mode setter first.
  for (const auto& req : replays)
  {
    EXPECT_FALSE(req.m_wants_response);
  }

  const auto& latest = cache.bindings().at(Sticky_state_cache::Binding_key("bindBuffer", to_value(34962)));
  EXPECT_EQ(latest.m_request_id, 3u);
  EXPECT_EQ(latest.m_args[1], to_value(5));
}

TEST(Sticky_state_cache, Whole_double_target_same_as_integer)
{
  Sticky_state_cache cache;
  EXPECT_TRUE(cache.record_targeted_setter(make_request(1, "bindBuffer", { to_value(34962), to_value(1) })));
  EXPECT_TRUE(cache.record_targeted_setter(make_request(2, "bindBuffer", { to_value(34962.0), to_value(2) })));
  EXPECT_TRUE(cache.record_targeted_setter(make_request(3, "bindBuffer", { to_value(34962.5), to_value(3) })));

  ASSERT_EQ(cache.bindings().size(), 2u);
  EXPECT_EQ(cache.bindings().at(Sticky_state_cache::Binding_key("bindBuffer", to_value(34962))).m_request_id, 2u);
  EXPECT_EQ(cache.bindings().at(Sticky_state_cache::Binding_key("bindBuffer", to_value(34962.5))).m_request_id,
            3u);
}

TEST(Sticky_state_cache, Nan_target_not_recorded)
{
  Sticky_state_cache cache;
  EXPECT_FALSE(cache.record_targeted_setter(make_request(1, "bindBuffer",
                                                         { to_value(std::numeric_limits<double>::quiet_NaN()),
                                                           to_value(1) })));
  EXPECT_TRUE(cache.bindings().empty());
  EXPECT_TRUE(cache.replay_list().empty());
}

} // namespace glproxy::owner::test
