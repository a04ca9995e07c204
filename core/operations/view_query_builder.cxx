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

#include "view_query_builder.hxx"

#include "core/utils/json.hxx"
#include "core/utils/url_codec.hxx"
#include "core/view_option_names.hxx"

#include <couchview/error_codes.hxx>

#include <fmt/core.h>

namespace couchview::core::operations
{
namespace
{
auto
is_key_option(std::string_view name) -> bool
{
  return name == view_option::key || name == view_option::keys || name == view_option::start_key ||
         name == view_option::end_key;
}

/**
 * Keys are always JSON encoded, other strings go as is, everything else is sent in its JSON form.
 * Values are not validated, the server is the authority on them.
 */
auto
to_query_value(std::string_view name, const tao::json::value& value) -> std::string
{
  if (is_key_option(name)) {
    return utils::json::generate(value);
  }
  if (value.is_string()) {
    return value.get_string();
  }
  return utils::json::generate(value);
}
} // namespace

auto
view_wire_query::method() const -> std::string
{
  return body ? "POST" : "GET";
}

auto
view_wire_query::encoded_query_string() const -> std::string
{
  return utils::string_codec::form_encode(query_string);
}

auto
view_wire_query::encoded_target() const -> std::string
{
  if (query_string.empty()) {
    return path;
  }
  return fmt::format("{}?{}", path, encoded_query_string());
}

auto
view_wire_query::encoded_body() const -> std::string
{
  if (!body) {
    return {};
  }
  return utils::json::generate(body.value());
}

auto
view_wire_query::find(std::string_view name) const -> const std::string*
{
  for (const auto& [key, value] : query_string) {
    if (key == name) {
      return &value;
    }
  }
  return nullptr;
}

auto
view_wire_query::operator==(const view_wire_query& other) const -> bool
{
  return path == other.path && query_string == other.query_string && body == other.body;
}

auto
view_query_request::encode_to(view_wire_query& encoded) const -> std::error_code
{
  if (design_document_name.empty() || view_name.empty()) {
    return errc::common::invalid_argument;
  }
  encoded.path = fmt::format("/_design/{}/_view/{}",
                             utils::string_codec::form_encode(design_document_name),
                             utils::string_codec::form_encode(view_name));

  for (const auto& [option_name, option_value] : params) {
    const auto name = view_option::canonical_name(option_name);
    if (name == view_option::quiet) {
      continue;
    }
    if (name == view_option::body) {
      if (!option_value.is_object()) {
        return errc::common::invalid_argument;
      }
      tao::json::value payload = tao::json::empty_object;
      for (const auto& [nested_name, nested_value] : option_value.get_object()) {
        const auto canonical = view_option::canonical_name(nested_name);
        if (canonical == view_option::body || canonical == view_option::quiet) {
          continue;
        }
        payload[canonical] = nested_value;
      }
      encoded.body.emplace(std::move(payload));
      continue;
    }
    encoded.query_string.emplace_back(name, to_query_value(name, option_value));
  }
  return {};
}
} // namespace couchview::core::operations
