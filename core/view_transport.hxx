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

#include "core/operations/view_query_builder.hxx"
#include "core/utils/json_stream_control.hxx"
#include "core/view_raw_row.hxx"

#include <couchview/error.hxx>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace asio
{
class io_context;
} // namespace asio

namespace couchview::core
{
/**
 * Identifies the view on the side of the transport.
 */
struct view_handle {
  std::string bucket_name{};
  std::string design_document_name{};
  std::string view_name{};
};

using view_stream_handler = std::function<utils::json::stream_control(view_stream_item)>;

/**
 * Row-producing handle of the submitted query.
 */
class view_row_stream
{
public:
  virtual ~view_row_stream() = default;

  /**
   * Reads the whole stream and returns all items together with the number of rows in the index.
   */
  virtual auto to_list() -> std::pair<error, view_stream_result> = 0;

  /**
   * Pushes items to the handler one by one in the order the server delivered them, until the
   * stream is exhausted or the handler returns stream_control::stop.
   */
  virtual auto for_each(const view_stream_handler& handler) -> error = 0;
};

/**
 * Connection that performs the network I/O on behalf of the views.
 */
class view_transport
{
public:
  virtual ~view_transport() = default;

  virtual auto resolve_view(const std::string& design_document_name, const std::string& view_name)
    -> std::pair<error, view_handle> = 0;

  virtual auto submit_query(const view_handle& handle, const operations::view_wire_query& query)
    -> std::pair<error, std::shared_ptr<view_row_stream>> = 0;

  /**
   * The event loop of the asynchronous transport, or nullptr if the transport is synchronous.
   */
  [[nodiscard]] virtual auto io_context() -> asio::io_context*
  {
    return nullptr;
  }
};
} // namespace couchview::core
