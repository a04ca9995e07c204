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
#include <string_view>

namespace couchview::core::view_option
{
constexpr std::string_view key{ "key" };
constexpr std::string_view keys{ "keys" };
constexpr std::string_view start_key{ "startkey" };
constexpr std::string_view start_key_doc_id{ "startkey_docid" };
constexpr std::string_view end_key{ "endkey" };
constexpr std::string_view end_key_doc_id{ "endkey_docid" };
constexpr std::string_view inclusive_end{ "inclusive_end" };
constexpr std::string_view limit{ "limit" };
constexpr std::string_view skip{ "skip" };
constexpr std::string_view descending{ "descending" };
constexpr std::string_view stale{ "stale" };
constexpr std::string_view reduce{ "reduce" };
constexpr std::string_view group{ "group" };
constexpr std::string_view group_level{ "group_level" };
constexpr std::string_view include_docs{ "include_docs" };
constexpr std::string_view quiet{ "quiet" };
constexpr std::string_view on_error{ "on_error" };
constexpr std::string_view connection_timeout{ "connection_timeout" };
constexpr std::string_view body{ "body" };

/**
 * Resolves synonym spelling of the option to the name used on the wire.
 */
inline auto
canonical_name(std::string_view name) -> std::string
{
  if (name == "start_key") {
    return std::string{ start_key };
  }
  if (name == "end_key") {
    return std::string{ end_key };
  }
  if (name == "start_key_doc_id") {
    return std::string{ start_key_doc_id };
  }
  if (name == "end_key_doc_id") {
    return std::string{ end_key_doc_id };
  }
  return std::string{ name };
}
} // namespace couchview::core::view_option
