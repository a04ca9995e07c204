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

#include <couchview/view_options.hxx>

#include <tao/json/value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace couchview::core::operations
{
/**
 * Wire-level representation of the view query.
 */
struct view_wire_query {
  std::string path{};
  std::vector<std::pair<std::string, std::string>> query_string{};
  std::optional<tao::json::value> body{};

  [[nodiscard]] auto method() const -> std::string;
  [[nodiscard]] auto encoded_query_string() const -> std::string;
  [[nodiscard]] auto encoded_target() const -> std::string;
  [[nodiscard]] auto encoded_body() const -> std::string;

  /**
   * Returns the value of the query string parameter or nullptr if it has not been set.
   */
  [[nodiscard]] auto find(std::string_view name) const -> const std::string*;

  auto operator==(const view_wire_query& other) const -> bool;
};

struct view_query_request {
  std::string design_document_name;
  std::string view_name;
  view_query_params params{};

  /**
   * Encodes the parameters. Keys (`key`, `keys`, `startkey`, `endkey`) are always JSON encoded,
   * synonym names are resolved, `quiet` is never sent and the contents of `body` end up in the
   * request payload.
   *
   * @return errc::common::invalid_argument if the raw `body` option is not an object
   */
  [[nodiscard]] auto encode_to(view_wire_query& encoded) const -> std::error_code;
};
} // namespace couchview::core::operations
