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

#include <string>

namespace couchview
{
/**
 * Name pair of the view, parsed once from the endpoint path.
 *
 * Two forms of the endpoint are accepted:
 *  * `_design/<design document>/_view/<view>`
 *  * `<design document>/_view/<view>`
 *
 * @since 1.0.0
 * @committed
 */
class view_identity
{
public:
  /**
   * @throws std::system_error with errc::common::invalid_argument if the endpoint does not have
   * the names at the expected positions
   *
   * @since 1.0.0
   * @committed
   */
  explicit view_identity(std::string endpoint);

  [[nodiscard]] auto endpoint() const -> const std::string&;
  [[nodiscard]] auto design_document_name() const -> const std::string&;
  [[nodiscard]] auto view_name() const -> const std::string&;

  auto operator==(const view_identity& other) const -> bool;

private:
  std::string endpoint_;
  std::string design_document_name_{};
  std::string view_name_{};
};
} // namespace couchview
