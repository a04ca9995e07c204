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

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace couchview
{
#ifndef COUCHVIEW_DOXYGEN
namespace core
{
class view_transport;
} // namespace core
#endif

/**
 * Single row of the view result.
 *
 * Besides the fixed fields, the row gives dictionary-like access to the fields of the embedded
 * document (see #get(), #set() and #has_key()).
 *
 * @since 1.0.0
 * @committed
 */
class view_row
{
public:
  view_row() = default;

  /**
   * @param transport connection that produced the row, might be used to fetch the document again
   *
   * @since 1.0.0
   * @volatile
   */
  explicit view_row(std::shared_ptr<core::view_transport> transport);

  /**
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto key() const -> const tao::json::value&;

  auto set_key(tao::json::value key) -> void;

  /**
   * Value emitted by the map function, or the result of reduction for reduced rows. Not set for
   * rows joined with documents.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto value() const -> const tao::json::value&;

  auto set_value(tao::json::value value) -> void;

  /**
   * Body of the document, set only when the view has been executed with `include_docs`.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto document() const -> const tao::json::value&;

  auto set_document(tao::json::value document) -> void;

  /**
   * Document metadata: `id` and the `flags`, `cas` and `expiration` reported together with the
   * document.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto metadata() const -> const tao::json::value&;

  auto set_metadata(tao::json::value metadata) -> void;

  /**
   * Document identifier. Empty for reduced rows.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto id() const -> const std::optional<std::string>&;

  auto set_id(std::optional<std::string> id) -> void;

  /**
   * GeoJSON geometry of the spatial row.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto geometry() const -> const tao::json::value&;

  /**
   * Bounding box of the spatial row.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto bbox() const -> const std::vector<double>&;

  auto set_spatial(tao::json::value geometry, std::vector<double> bbox) -> void;

  /**
   * Returns the field of the embedded document.
   *
   * @return empty optional if there is no document or it does not have the field
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto get(const std::string& name) const -> std::optional<tao::json::value>;

  /**
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto has_key(const std::string& name) const -> bool;

  /**
   * Sets the field of the embedded document. Missing document is created as empty object.
   *
   * @throws std::system_error with errc::common::invalid_argument if the document is not an object
   *
   * @since 1.0.0
   * @committed
   */
  auto set(const std::string& name, tao::json::value value) -> void;

  /**
   * Whether the row is the last one of the result stream.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto is_last() const -> bool;

  /**
   * @since 1.0.0
   * @internal
   */
  auto mark_last() -> void;

  /**
   * @since 1.0.0
   * @volatile
   */
  [[nodiscard]] auto transport() const -> const std::shared_ptr<core::view_transport>&;

  template<typename T>
  [[nodiscard]] auto key_as() const -> T
  {
    return key_.as<T>();
  }

  template<typename T>
  [[nodiscard]] auto value_as() const -> T
  {
    return value_.as<T>();
  }

  template<typename T>
  [[nodiscard]] auto document_as() const -> T
  {
    if (document_.is_null()) {
      return T{};
    }
    return document_.as<T>();
  }

private:
  std::shared_ptr<core::view_transport> transport_{};
  tao::json::value key_{ tao::json::null };
  tao::json::value value_{ tao::json::null };
  tao::json::value document_{ tao::json::null };
  tao::json::value metadata_{ tao::json::null };
  std::optional<std::string> id_{};
  tao::json::value geometry_{ tao::json::null };
  std::vector<double> bbox_{};
  bool last_{ false };
};
} // namespace couchview
