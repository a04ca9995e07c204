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

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace couchview
{
/**
 * Materialized result of the view query.
 *
 * The number of total rows is reported by the server and describes the whole index, so it does not
 * depend on limits applied to the query.
 *
 * @tparam Row type of the row produced by the wrapper of the view
 *
 * @since 1.0.0
 * @committed
 */
template<typename Row>
class view_result
{
public:
  using row_type = Row;
  using const_iterator = typename std::vector<Row>::const_iterator;

  view_result() = default;

  /**
   * @since 1.0.0
   * @internal
   */
  view_result(std::vector<Row> rows, std::uint64_t total_rows)
    : rows_{ std::move(rows) }
    , total_rows_{ total_rows }
  {
  }

  /**
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto rows() const -> const std::vector<Row>&
  {
    return rows_;
  }

  /**
   * Moves the rows out of the result.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto take_rows() -> std::vector<Row>
  {
    return std::move(rows_);
  }

  /**
   * Number of rows in the index as reported by the server.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto total_rows() const -> std::uint64_t
  {
    return total_rows_;
  }

  /**
   * Alias for #total_rows()
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto total_entries() const -> std::uint64_t
  {
    return total_rows_;
  }

  [[nodiscard]] auto size() const -> std::size_t
  {
    return rows_.size();
  }

  [[nodiscard]] auto empty() const -> bool
  {
    return rows_.empty();
  }

  [[nodiscard]] auto begin() const -> const_iterator
  {
    return rows_.begin();
  }

  [[nodiscard]] auto end() const -> const_iterator
  {
    return rows_.end();
  }

private:
  std::vector<Row> rows_{};
  std::uint64_t total_rows_{ 0 };
};
} // namespace couchview
