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

#include <couchview/view_on_error.hxx>
#include <couchview/view_scan_consistency.hxx>

#include <tao/json/value.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace couchview
{
/**
 * Parameters of the view query, keyed by canonical option name.
 *
 * @since 1.0.0
 * @internal
 */
using view_query_params = std::map<std::string, tao::json::value, std::less<>>;

/**
 * Options for view#fetch() and its derivatives.
 *
 * Every setter stores the value under the canonical name of the option, so that the short and the
 * long spelling of the range boundaries (e.g. `start_key` and `startkey`) end up as a single entry.
 *
 * @since 1.0.0
 * @committed
 */
class view_options
{
public:
  /**
   * Immutable value object representing consistent options.
   *
   * @since 1.0.0
   * @internal
   */
  struct built {
    view_query_params params;
  };

  /**
   * Returns the options as an immutable value.
   *
   * @since 1.0.0
   * @internal
   */
  [[nodiscard]] auto build() const -> built;

  /**
   * Return only documents that match the specified key. Will be JSON encoded.
   *
   * @since 1.0.0
   * @committed
   */
  auto key(tao::json::value key) -> view_options&;

  /**
   * The same as #key(), but will work for set of keys. Will be JSON encoded.
   *
   * @since 1.0.0
   * @committed
   */
  auto keys(std::vector<tao::json::value> keys) -> view_options&;

  /**
   * Return records starting with the specified key. Will be JSON encoded.
   *
   * @since 1.0.0
   * @committed
   */
  auto start_key(tao::json::value key) -> view_options&;

  /**
   * Document id to start with (to allow pagination for duplicate start keys).
   *
   * @since 1.0.0
   * @committed
   */
  auto start_key_doc_id(std::string document_id) -> view_options&;

  /**
   * Stop returning records when the specified key is reached. Will be JSON encoded.
   *
   * @since 1.0.0
   * @committed
   */
  auto end_key(tao::json::value key) -> view_options&;

  /**
   * Last document id to include in the output (to allow pagination for duplicate end keys).
   *
   * @since 1.0.0
   * @committed
   */
  auto end_key_doc_id(std::string document_id) -> view_options&;

  /**
   * Specifies whether the specified end key should be included in the result (server default is
   * `true`).
   *
   * @since 1.0.0
   * @committed
   */
  auto inclusive_end(bool inclusive_end) -> view_options&;

  /**
   * Limit the number of rows in the output.
   *
   * @since 1.0.0
   * @committed
   */
  auto limit(std::uint64_t limit) -> view_options&;

  /**
   * Skip this number of records before starting to return the results.
   *
   * @since 1.0.0
   * @committed
   */
  auto skip(std::uint64_t skip) -> view_options&;

  /**
   * Return the rows in descending by key order.
   *
   * @since 1.0.0
   * @committed
   */
  auto descending(bool descending) -> view_options&;

  /**
   * Allow the results from a stale view to be used.
   *
   * @since 1.0.0
   * @committed
   */
  auto scan_consistency(view_scan_consistency scan_consistency) -> view_options&;

  /**
   * Use the reduction function (server default is `true`).
   *
   * @since 1.0.0
   * @committed
   */
  auto reduce(bool reduce) -> view_options&;

  /**
   * Group the results using the reduce function to a group or single row.
   *
   * @since 1.0.0
   * @committed
   */
  auto group(bool group) -> view_options&;

  /**
   * Specify the group level to be used.
   *
   * @since 1.0.0
   * @committed
   */
  auto group_level(std::uint32_t group_level) -> view_options&;

  /**
   * Include the full content of the documents in the return.
   *
   * @since 1.0.0
   * @committed
   */
  auto include_docs(bool include_docs) -> view_options&;

  /**
   * Do not raise error if associated document not found in the memory. Reserved for the
   * transport, it is not sent to the server. Defaults to `true`.
   *
   * @since 1.0.0
   * @uncommitted
   */
  auto quiet(bool quiet) -> view_options&;

  /**
   * Sets the response in the event of an error on one of the nodes.
   *
   * @since 1.0.0
   * @committed
   */
  auto on_error(view_on_error on_error) -> view_options&;

  /**
   * Timeout before the view request is dropped (75 seconds by default).
   *
   * @since 1.0.0
   * @committed
   */
  auto connection_timeout(std::chrono::milliseconds timeout) -> view_options&;

  /**
   * Accepts the same options, except body of course, but sends them in the request body instead of
   * the query string. It could be useful for really large and complex parameters, like long lists
   * of keys.
   *
   * @since 1.0.0
   * @committed
   */
  auto body(const view_options& body) -> view_options&;

  /**
   * Sets any option by name. Synonyms are resolved to the canonical name, unknown names are sent to
   * the server as is.
   *
   * @since 1.0.0
   * @committed
   */
  auto raw(const std::string& name, tao::json::value value) -> view_options&;

  /**
   * Merges other options over this set, the values of the other set win.
   *
   * @since 1.0.0
   * @internal
   */
  auto merge(const view_options& other) -> view_options&;

private:
  view_query_params params_{};
};
} // namespace couchview
