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

#include <couchview/view_row.hxx>

#include <fmt/core.h>
#include <tao/json/to_string.hpp>
#include <tao/json/value.hpp>

/**
 * Helper for fmtlib to format @ref couchview::view_row objects.
 *
 * @since 1.0.0
 * @uncommitted
 */
template<>
struct fmt::formatter<couchview::view_row> {
  template<typename ParseContext>
  constexpr auto parse(ParseContext& ctx)
  {
    return ctx.begin();
  }

  template<typename FormatContext>
  auto format(const couchview::view_row& row, FormatContext& ctx) const
  {
    return format_to(ctx.out(),
                     "#<view_row id={}, key={}, value={}, document={}, metadata={}>",
                     row.id() ? tao::json::to_string(tao::json::value(row.id().value())) : "null",
                     tao::json::to_string(row.key()),
                     tao::json::to_string(row.value()),
                     tao::json::to_string(row.document()),
                     tao::json::to_string(row.metadata()));
  }
};
