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
#include "core/view_transport.hxx"

#include <couchview/error.hxx>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace test::utils
{
/**
 * Row stream replaying prepared items. The failure, if set, is reported after all items have been
 * delivered.
 */
class replay_row_stream : public couchview::core::view_row_stream
{
public:
  replay_row_stream(couchview::core::view_stream_result result, couchview::error failure);

  auto to_list() -> std::pair<couchview::error, couchview::core::view_stream_result> override;

  auto for_each(const couchview::core::view_stream_handler& handler) -> couchview::error override;

  [[nodiscard]] auto delivered_items() const -> std::size_t;

private:
  couchview::core::view_stream_result result_;
  couchview::error failure_;
  std::size_t delivered_items_{ 0 };
};

/**
 * In-memory transport of the views. Responds to every query with canned view response body, or
 * with prepared stream items.
 */
class mock_view_transport : public couchview::core::view_transport
{
public:
  explicit mock_view_transport(asio::io_context* io = nullptr);

  void respond_with(std::uint32_t status_code, std::string body);

  void respond_with(couchview::core::view_stream_result result,
                    couchview::error stream_failure = {});

  void fail_resolve_with(couchview::error err);

  auto resolve_view(const std::string& design_document_name, const std::string& view_name)
    -> std::pair<couchview::error, couchview::core::view_handle> override;

  auto submit_query(const couchview::core::view_handle& handle,
                    const couchview::core::operations::view_wire_query& query)
    -> std::pair<couchview::error, std::shared_ptr<couchview::core::view_row_stream>> override;

  [[nodiscard]] auto io_context() -> asio::io_context* override;

  [[nodiscard]] auto resolve_calls() const -> std::size_t;
  [[nodiscard]] auto queries() const
    -> const std::vector<couchview::core::operations::view_wire_query>&;
  [[nodiscard]] auto last_query() const -> const couchview::core::operations::view_wire_query&;
  [[nodiscard]] auto last_handle() const -> const couchview::core::view_handle&;
  [[nodiscard]] auto last_stream() const -> const std::shared_ptr<replay_row_stream>&;

private:
  asio::io_context* io_;
  std::uint32_t status_code_{ 200 };
  std::string body_{ R"({"total_rows":0,"rows":[]})" };
  std::optional<couchview::core::view_stream_result> items_{};
  couchview::error stream_failure_{};
  couchview::error resolve_failure_{};
  std::size_t resolve_calls_{ 0 };
  std::vector<couchview::core::operations::view_wire_query> queries_{};
  couchview::core::view_handle last_handle_{};
  std::shared_ptr<replay_row_stream> last_stream_{};
};

/**
 * Builds raw row of the map-only view without documents.
 */
auto
make_row(const std::string& id, tao::json::value key, tao::json::value value)
  -> couchview::core::view_stream_item;

auto
make_stream_error(const std::string& from, const std::string& reason)
  -> couchview::core::view_stream_item;
} // namespace test::utils
