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

#include <couchview/view_row.hxx>

#include <couchview/error_codes.hxx>

#include <fmt/core.h>

#include <system_error>
#include <utility>

namespace couchview
{
view_row::view_row(std::shared_ptr<core::view_transport> transport)
  : transport_{ std::move(transport) }
{
}

auto
view_row::key() const -> const tao::json::value&
{
  return key_;
}

auto
view_row::set_key(tao::json::value key) -> void
{
  key_ = std::move(key);
}

auto
view_row::value() const -> const tao::json::value&
{
  return value_;
}

auto
view_row::set_value(tao::json::value value) -> void
{
  value_ = std::move(value);
}

auto
view_row::document() const -> const tao::json::value&
{
  return document_;
}

auto
view_row::set_document(tao::json::value document) -> void
{
  document_ = std::move(document);
}

auto
view_row::metadata() const -> const tao::json::value&
{
  return metadata_;
}

auto
view_row::set_metadata(tao::json::value metadata) -> void
{
  metadata_ = std::move(metadata);
}

auto
view_row::id() const -> const std::optional<std::string>&
{
  return id_;
}

auto
view_row::set_id(std::optional<std::string> id) -> void
{
  id_ = std::move(id);
}

auto
view_row::geometry() const -> const tao::json::value&
{
  return geometry_;
}

auto
view_row::bbox() const -> const std::vector<double>&
{
  return bbox_;
}

auto
view_row::set_spatial(tao::json::value geometry, std::vector<double> bbox) -> void
{
  geometry_ = std::move(geometry);
  bbox_ = std::move(bbox);
}

auto
view_row::get(const std::string& name) const -> std::optional<tao::json::value>
{
  if (!document_.is_object()) {
    return {};
  }
  if (const auto* field = document_.find(name); field != nullptr) {
    return *field;
  }
  return {};
}

auto
view_row::has_key(const std::string& name) const -> bool
{
  return document_.is_object() && document_.find(name) != nullptr;
}

auto
view_row::set(const std::string& name, tao::json::value value) -> void
{
  if (document_.is_null()) {
    document_ = tao::json::empty_object;
  }
  if (!document_.is_object()) {
    throw std::system_error(
      errc::common::invalid_argument,
      fmt::format("unable to set field \"{}\", the document of the row is not an object", name));
  }
  document_[name] = std::move(value);
}

auto
view_row::is_last() const -> bool
{
  return last_;
}

auto
view_row::mark_last() -> void
{
  last_ = true;
}

auto
view_row::transport() const -> const std::shared_ptr<core::view_transport>&
{
  return transport_;
}
} // namespace couchview
