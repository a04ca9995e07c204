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

#include "core/view_transport.hxx"

#include <couchview/error.hxx>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace couchview::core::operations
{
/**
 * Row stream over the complete body of the view response, for transports that receive the body
 * at once.
 */
class buffered_view_row_stream : public view_row_stream
{
public:
  explicit buffered_view_row_stream(view_stream_result result);

  /**
   * Parses the HTTP response of the view service.
   *
   * Rows are classified by their shape: rows with `geometry` or `bbox` are spatial, rows with
   * `doc` are joined with documents, rows without `id` are reduced. Objects of `errors` array
   * become error items, which follow the rows.
   */
  static auto parse(std::uint32_t status_code, const std::string& body, const view_handle& handle)
    -> std::pair<error, std::shared_ptr<buffered_view_row_stream>>;

  auto to_list() -> std::pair<error, view_stream_result> override;

  auto for_each(const view_stream_handler& handler) -> error override;

private:
  view_stream_result result_;
};

/**
 * Builds error for non-successful HTTP response of the view service. The body might be an object
 * with `errors` (reasons per node) or with `error` and `reason` fields. A body that cannot be
 * parsed only leaves type and reason unset.
 */
auto
make_view_http_error(std::uint32_t status_code, const std::string& body, const view_handle& handle)
  -> error;
} // namespace couchview::core::operations
