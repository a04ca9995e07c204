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

#include <couchview/error_context.hxx>

#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace couchview
{
/**
 * Outcome of a view operation.
 *
 * Default-constructed error means success. Otherwise #ec() holds one of the codes of
 * couchview::errc, for example:
 *
 * * errc::common::invalid_argument: the endpoint, the options or the handler are not usable, the
 *   request has not been sent.
 * * errc::view::view_execution_failure: the result stream carried an error object of some node,
 *   and no observer was registered with view#on_error().
 * * errc::common::decoding_failure: the row could not be decoded by the row wrapper.
 * * errc::network::*, errc::view::view_not_found, errc::common::internal_server_failure: reported
 *   by the transport or derived from the HTTP status of the response.
 *
 * @since 1.0.0
 * @committed
 */
class error
{
public:
  error() = default;
  error(std::error_code ec, std::string message = {}, error_context ctx = {});

  /**
   * Wraps lower level error (e.g. failure of the transport) into error of the view.
   *
   * @since 1.0.0
   * @committed
   */
  error(std::error_code ec, std::string message, error_context ctx, error cause);

  [[nodiscard]] auto ec() const -> std::error_code;
  [[nodiscard]] auto message() const -> const std::string&;

  /**
   * Names of the design document and the view, HTTP status and body, origin node and reason,
   * whatever is known at the point of the failure.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto ctx() const -> const error_context&;
  [[nodiscard]] auto cause() const -> std::optional<error>;

  /**
   * @return true if the error carries non-zero code
   */
  explicit operator bool() const;

  /**
   * Errors are equal when both code and message match, contexts and causes are not compared.
   */
  auto operator==(const error& other) const -> bool;

private:
  std::error_code ec_{};
  std::string message_{};
  error_context ctx_{};
  std::shared_ptr<error> cause_{};
};
} // namespace couchview
