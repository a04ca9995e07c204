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

#include "core/view_raw_row.hxx"
#include "core/view_transport.hxx"

#include <couchview/error.hxx>
#include <couchview/view_identity.hxx>
#include <couchview/view_options.hxx>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace couchview::core
{
/**
 * Observer of the error objects embedded into the result stream.
 */
using view_error_handler = std::function<void(const std::string& from, const std::string& reason)>;

/**
 * Receives rows of the streaming fetch. Non-empty error stops the stream and is returned to the
 * caller.
 */
using view_raw_row_handler = std::function<error(const raw_view_row& row, bool last_row)>;

struct view_collected_rows {
  std::vector<raw_view_row> rows{};
  std::uint64_t total_rows{ 0 };
};

/**
 * Submits queries of the single view and drives consumption of the result stream.
 */
class view_executor
{
public:
  /**
   * @throws std::system_error with errc::common::invalid_argument if the transport is not set
   */
  view_executor(std::shared_ptr<view_transport> transport,
                view_identity identity,
                const view_options& default_options);

  void set_error_handler(view_error_handler handler);

  [[nodiscard]] auto transport() const -> const std::shared_ptr<view_transport>&;
  [[nodiscard]] auto identity() const -> const view_identity&;
  [[nodiscard]] auto default_options() const -> const view_options&;

  /**
   * @return the event loop of the transport, or nullptr if the transport is synchronous
   */
  [[nodiscard]] auto io_context() const -> asio::io_context*;

  /**
   * Pushes rows to the handler one by one without buffering them.
   */
  auto stream(const view_options& options, const view_raw_row_handler& handler) -> error;

  /**
   * Reads the whole result and returns rows together with the total number of rows in the index.
   */
  auto collect(const view_options& options) -> std::pair<error, view_collected_rows>;

private:
  auto submit(const view_options& options) -> std::pair<error, std::shared_ptr<view_row_stream>>;
  auto handle_stream_error(const view_stream_error& problem) const -> error;

  std::shared_ptr<view_transport> transport_;
  view_identity identity_;
  view_options default_options_{};
  view_error_handler error_handler_{};
};
} // namespace couchview::core
