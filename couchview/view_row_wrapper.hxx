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

#include <core/view_raw_row.hxx>
#include <couchview/view_row.hxx>

#include <memory>
#include <type_traits>
#include <utility>

namespace couchview
{
/**
 * Converts rows of the view stream into @ref view_row objects.
 *
 * Key and id are copied for every row shape. The value is set for rows without documents and for
 * reduced rows (decoded from its JSON text). Rows with documents carry the document and the
 * metadata, spatial rows carry geometry and bounding box.
 *
 * @since 1.0.0
 * @committed
 */
struct default_row_wrapper {
  /**
   * @throws std::system_error with errc::common::decoding_failure if the value of the reduced row
   * is not a valid JSON
   */
  static auto wrap(const std::shared_ptr<core::view_transport>& transport,
                   const core::raw_view_row& row) -> view_row;
};

/**
 * Checks that the type can be used to wrap rows of the view, i.e. it exposes static
 * `wrap(transport, raw_row)`.
 *
 * @since 1.0.0
 * @committed
 */
template<typename Wrapper, typename = void>
struct is_row_wrapper : public std::false_type {
};

template<typename Wrapper>
struct is_row_wrapper<Wrapper,
                      std::void_t<decltype(Wrapper::wrap(
                        std::declval<const std::shared_ptr<core::view_transport>&>(),
                        std::declval<const core::raw_view_row&>()))>> : public std::true_type {
};

template<typename Wrapper>
inline constexpr bool is_row_wrapper_v = is_row_wrapper<Wrapper>::value;

template<typename Wrapper>
using wrapped_row_t = std::decay_t<decltype(Wrapper::wrap(
  std::declval<const std::shared_ptr<core::view_transport>&>(),
  std::declval<const core::raw_view_row&>()))>;

/**
 * Rows that can carry the "last row of the stream" flag expose `mark_last()`.
 */
template<typename Row, typename = void>
struct has_mark_last : public std::false_type {
};

template<typename Row>
struct has_mark_last<Row, std::void_t<decltype(std::declval<Row&>().mark_last())>>
  : public std::true_type {
};

template<typename Row>
inline constexpr bool has_mark_last_v = has_mark_last<Row>::value;
} // namespace couchview
