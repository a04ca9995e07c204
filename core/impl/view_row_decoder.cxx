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

#include <couchview/view_row_wrapper.hxx>

#include "core/utils/json.hxx"

#include <couchview/error_codes.hxx>

#include <tao/json.hpp>

#include <array>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace couchview
{
namespace
{
constexpr std::array<std::pair<const char*, const char*>, 3> document_metadata_fields{ {
  { "$flags", "flags" },
  { "$cas", "cas" },
  { "$expiration", "expiration" },
} };

/**
 * Splits the document and its metadata. The server reports flags, CAS and expiration as reserved
 * fields of the document.
 */
void
assign_document(view_row& row, const std::string& id, tao::json::value document)
{
  tao::json::value metadata{
    { "id", id },
  };
  if (document.is_object()) {
    for (const auto& [reserved_name, name] : document_metadata_fields) {
      if (const auto* field = document.find(reserved_name); field != nullptr) {
        metadata[name] = *field;
        document.erase(reserved_name);
      }
    }
  }
  row.set_document(std::move(document));
  row.set_metadata(std::move(metadata));
}

auto
decode_reduced_value(const std::string& value) -> tao::json::value
{
  try {
    return core::utils::json::parse(value);
  } catch (const tao::pegtl::parse_error& e) {
    throw std::system_error(errc::common::decoding_failure,
                            "unable to decode value of the reduced row: " +
                              std::string{ e.what() });
  }
}
} // namespace

auto
default_row_wrapper::wrap(const std::shared_ptr<core::view_transport>& transport,
                          const core::raw_view_row& raw) -> view_row
{
  view_row row{ transport };
  if (const auto* plain = std::get_if<core::view_row_no_docs>(&raw); plain != nullptr) {
    row.set_id(plain->id);
    row.set_key(plain->key);
    row.set_value(plain->value);
  } else if (const auto* with_docs = std::get_if<core::view_row_with_docs>(&raw);
             with_docs != nullptr) {
    row.set_id(with_docs->id);
    row.set_key(with_docs->key);
    assign_document(row, with_docs->id, with_docs->document);
  } else if (const auto* reduced = std::get_if<core::view_row_reduced>(&raw); reduced != nullptr) {
    row.set_key(reduced->key);
    row.set_value(decode_reduced_value(reduced->value));
  } else if (const auto* spatial = std::get_if<core::spatial_view_row_no_docs>(&raw);
             spatial != nullptr) {
    row.set_id(spatial->id);
    row.set_key(spatial->key);
    row.set_value(spatial->value);
    row.set_spatial(spatial->geometry, spatial->bbox);
  } else if (const auto* spatial_with_docs = std::get_if<core::spatial_view_row_with_docs>(&raw);
             spatial_with_docs != nullptr) {
    row.set_id(spatial_with_docs->id);
    row.set_key(spatial_with_docs->key);
    assign_document(row, spatial_with_docs->id, spatial_with_docs->document);
    row.set_spatial(spatial_with_docs->geometry, spatial_with_docs->bbox);
  }
  return row;
}
} // namespace couchview
