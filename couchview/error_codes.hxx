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

#include <system_error>

namespace couchview
{
#ifndef COUCHVIEW_DOXYGEN
namespace core::impl
{
const std::error_category&
common_category() noexcept;

const std::error_category&
view_category() noexcept;

const std::error_category&
network_category() noexcept;
} // namespace core::impl
#endif

namespace errc
{
/**
 * Common errors for all modules.
 *
 * @since 1.0.0
 * @committed
 */
enum class common {
  /**
   * It is unambiguously determined that the error was caused because of invalid arguments from
   * the user. Raised before any network call is made, e.g. for a malformed endpoint, a raw `body`
   * option that is not an object, or a missing completion handler.
   *
   * @since 1.0.0
   * @committed
   */
  invalid_argument = 3,

  /**
   * Indicates the server returned an unexpected status that does not map to a more specific
   * error.
   *
   * @since 1.0.0
   * @committed
   */
  internal_server_failure = 5,

  /**
   * The response body of the server could not be parsed.
   *
   * @since 1.0.0
   * @committed
   */
  parsing_failure = 8,

  /**
   * A value of the row (e.g. the reduced value) could not be decoded.
   *
   * @since 1.0.0
   * @committed
   */
  decoding_failure = 20,
};

/**
 * Errors related to Views service (CAPI)
 *
 * @since 1.0.0
 * @committed
 */
enum class view {
  /**
   * View does not exist on the server.
   *
   * @since 1.0.0
   * @committed
   */
  // Http status code 404
  view_not_found = 501,

  /**
   * The view result stream contained an error object (e.g. one of the nodes was not reachable),
   * and no error observer has been registered on the view.
   *
   * @since 1.0.0
   * @committed
   */
  view_execution_failure = 503,
};

/**
 * Errors reported by the transport layer
 *
 * @since 1.0.0
 * @committed
 */
enum class network {
  resolve_failure = 1001,

  protocol_error = 1004,

  end_of_stream = 1007,
};

#ifndef COUCHVIEW_DOXYGEN
inline std::error_code
make_error_code(common e)
{
  return { static_cast<int>(e), core::impl::common_category() };
}

inline std::error_code
make_error_code(view e)
{
  return { static_cast<int>(e), core::impl::view_category() };
}

inline std::error_code
make_error_code(network e)
{
  return { static_cast<int>(e), core::impl::network_category() };
}
#endif
} // namespace errc
} // namespace couchview

#ifndef COUCHVIEW_DOXYGEN
template<>
struct std::is_error_code_enum<couchview::errc::common> : std::true_type {
};

template<>
struct std::is_error_code_enum<couchview::errc::view> : std::true_type {
};

template<>
struct std::is_error_code_enum<couchview::errc::network> : std::true_type {
};
#endif
