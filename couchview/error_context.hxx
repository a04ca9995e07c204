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

#include <string>

namespace couchview
{
using internal_error_context = tao::json::value;

enum class error_context_json_format {
  compact = 0,
  pretty,
};

/**
 * Diagnostic information attached to an @ref error.
 *
 * For view errors the context contains (when known) the design document and view names, the
 * encoded query, the node the error originated from (`from`), the server reason, the error type
 * and the HTTP status code.
 *
 * @since 1.0.0
 * @committed
 */
class error_context
{
public:
  error_context() = default;
  explicit error_context(internal_error_context internal);

  [[nodiscard]] auto to_json(
    error_context_json_format format = error_context_json_format::compact) const -> std::string;

  template<typename T>
  T as() const
  {
    if constexpr (std::is_same_v<T, internal_error_context>) {
      return internal_;
    } else {
      return internal_.as<T>();
    }
  }

  /**
   * Returns string property of the context, or empty string if the property does not exist.
   */
  [[nodiscard]] auto get_string(const std::string& name) const -> std::string;

  explicit operator bool() const;

private:
  internal_error_context internal_{};
};
} // namespace couchview
