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

#include <couchview/view_options.hxx>

#include "core/view_option_names.hxx"

#include <utility>

namespace couchview
{
namespace
{
auto
set_option(view_query_params& params, std::string_view name, tao::json::value value) -> void
{
  params.insert_or_assign(core::view_option::canonical_name(name), std::move(value));
}
} // namespace

auto
view_options::build() const -> built
{
  return { params_ };
}

auto
view_options::key(tao::json::value key) -> view_options&
{
  set_option(params_, core::view_option::key, std::move(key));
  return *this;
}

auto
view_options::keys(std::vector<tao::json::value> keys) -> view_options&
{
  tao::json::value keys_array = tao::json::empty_array;
  for (auto& entry : keys) {
    keys_array.push_back(std::move(entry));
  }
  set_option(params_, core::view_option::keys, std::move(keys_array));
  return *this;
}

auto
view_options::start_key(tao::json::value key) -> view_options&
{
  set_option(params_, core::view_option::start_key, std::move(key));
  return *this;
}

auto
view_options::start_key_doc_id(std::string document_id) -> view_options&
{
  set_option(params_, core::view_option::start_key_doc_id, std::move(document_id));
  return *this;
}

auto
view_options::end_key(tao::json::value key) -> view_options&
{
  set_option(params_, core::view_option::end_key, std::move(key));
  return *this;
}

auto
view_options::end_key_doc_id(std::string document_id) -> view_options&
{
  set_option(params_, core::view_option::end_key_doc_id, std::move(document_id));
  return *this;
}

auto
view_options::inclusive_end(bool inclusive_end) -> view_options&
{
  set_option(params_, core::view_option::inclusive_end, inclusive_end);
  return *this;
}

auto
view_options::limit(std::uint64_t limit) -> view_options&
{
  set_option(params_, core::view_option::limit, limit);
  return *this;
}

auto
view_options::skip(std::uint64_t skip) -> view_options&
{
  set_option(params_, core::view_option::skip, skip);
  return *this;
}

auto
view_options::descending(bool descending) -> view_options&
{
  set_option(params_, core::view_option::descending, descending);
  return *this;
}

auto
view_options::scan_consistency(view_scan_consistency scan_consistency) -> view_options&
{
  switch (scan_consistency) {
    case view_scan_consistency::not_bounded:
      set_option(params_, core::view_option::stale, "ok");
      break;
    case view_scan_consistency::update_after:
      set_option(params_, core::view_option::stale, "update_after");
      break;
    case view_scan_consistency::request_plus:
      set_option(params_, core::view_option::stale, false);
      break;
  }
  return *this;
}

auto
view_options::reduce(bool reduce) -> view_options&
{
  set_option(params_, core::view_option::reduce, reduce);
  return *this;
}

auto
view_options::group(bool group) -> view_options&
{
  set_option(params_, core::view_option::group, group);
  return *this;
}

auto
view_options::group_level(std::uint32_t group_level) -> view_options&
{
  set_option(params_, core::view_option::group_level, std::uint64_t{ group_level });
  return *this;
}

auto
view_options::include_docs(bool include_docs) -> view_options&
{
  set_option(params_, core::view_option::include_docs, include_docs);
  return *this;
}

auto
view_options::quiet(bool quiet) -> view_options&
{
  set_option(params_, core::view_option::quiet, quiet);
  return *this;
}

auto
view_options::on_error(view_on_error on_error) -> view_options&
{
  switch (on_error) {
    case view_on_error::resume:
      set_option(params_, core::view_option::on_error, "continue");
      break;
    case view_on_error::stop:
      set_option(params_, core::view_option::on_error, "stop");
      break;
  }
  return *this;
}

auto
view_options::connection_timeout(std::chrono::milliseconds timeout) -> view_options&
{
  set_option(params_,
             core::view_option::connection_timeout,
             static_cast<std::int64_t>(timeout.count()));
  return *this;
}

auto
view_options::body(const view_options& body) -> view_options&
{
  tao::json::value nested = tao::json::empty_object;
  for (const auto& [name, value] : body.params_) {
    if (name != core::view_option::body) {
      nested[name] = value;
    }
  }
  set_option(params_, core::view_option::body, std::move(nested));
  return *this;
}

auto
view_options::raw(const std::string& name, tao::json::value value) -> view_options&
{
  set_option(params_, name, std::move(value));
  return *this;
}

auto
view_options::merge(const view_options& other) -> view_options&
{
  for (const auto& [name, value] : other.params_) {
    params_.insert_or_assign(name, value);
  }
  return *this;
}
} // namespace couchview
