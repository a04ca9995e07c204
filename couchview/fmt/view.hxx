/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <couchview/view.hxx>

#include <fmt/core.h>
#include <tao/json/to_string.hpp>
#include <tao/json/value.hpp>

/**
 * Helper for fmtlib to format @ref couchview::view objects: the endpoint and the default options.
 *
 * @since 1.0.0
 * @uncommitted
 */
template<typename Wrapper>
struct fmt::formatter<couchview::view<Wrapper>> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(const couchview::view<Wrapper>& view, FormatContext& ctx) const
  {
    tao::json::value options = tao::json::empty_object;
    for (const auto& [name, value] : view.default_options().build().params) {
      options[name] = value;
    }
    return format_to(ctx.out(),
                     "#<view endpoint={}, options={}>",
                     tao::json::to_string(tao::json::value(view.endpoint())),
                     tao::json::to_string(options));
  }
};
