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

#include <tao/json/value.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace couchview::core
{
/**
 * Row of the map-only view, executed without `include_docs`.
 */
struct view_row_no_docs {
  std::string id;
  tao::json::value key;
  tao::json::value value;
};

/**
 * Row of the map-only view, joined with the document body.
 */
struct view_row_with_docs {
  std::string id;
  tao::json::value key;
  tao::json::value value;
  tao::json::value document;
};

/**
 * Row of the view with reduce function. Reduced rows do not have document id, and the value is
 * delivered as JSON text.
 */
struct view_row_reduced {
  tao::json::value key;
  std::string value;
};

struct spatial_view_row_no_docs {
  std::string id;
  tao::json::value key;
  tao::json::value value;
  tao::json::value geometry;
  std::vector<double> bbox;
};

struct spatial_view_row_with_docs {
  std::string id;
  tao::json::value key;
  tao::json::value value;
  tao::json::value geometry;
  std::vector<double> bbox;
  tao::json::value document;
};

using raw_view_row = std::variant<view_row_no_docs,
                                  view_row_with_docs,
                                  view_row_reduced,
                                  spatial_view_row_no_docs,
                                  spatial_view_row_with_docs>;

/**
 * Error object embedded into the result stream, reported by the node `from`.
 */
struct view_stream_error {
  std::string from;
  std::string reason;
};

/**
 * Single item of the row stream. The `last_row` flag is set by the stream on the final row (no
 * more rows follow it, only error objects might).
 */
struct view_stream_item {
  std::variant<raw_view_row, view_stream_error> entry;
  bool last_row{ false };
};

/**
 * Fully materialized row stream.
 */
struct view_stream_result {
  std::vector<view_stream_item> items{};
  std::uint64_t total_rows{ 0 };
};
} // namespace couchview::core
