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

#include <couchview/view_identity.hxx>

#include <couchview/error_codes.hxx>

#include <fmt/core.h>

#include <string_view>
#include <system_error>
#include <vector>

namespace couchview
{
namespace
{
constexpr std::string_view design_document_marker{ "_design" };

auto
split_path(const std::string& path) -> std::vector<std::string>
{
  std::vector<std::string> parts{};
  std::size_t begin = 0;
  while (true) {
    auto end = path.find('/', begin);
    if (end == std::string::npos) {
      parts.emplace_back(path.substr(begin));
      break;
    }
    parts.emplace_back(path.substr(begin, end - begin));
    begin = end + 1;
  }
  return parts;
}
} // namespace

view_identity::view_identity(std::string endpoint)
  : endpoint_{ std::move(endpoint) }
{
  auto parts = split_path(endpoint_);
  std::size_t design_document_index = 0;
  std::size_t view_index = 2;
  if (endpoint_.rfind(design_document_marker, 0) == 0) {
    design_document_index = 1;
    view_index = 3;
  }
  if (parts.size() <= view_index || parts[design_document_index].empty() ||
      parts[view_index].empty()) {
    throw std::system_error(
      errc::common::invalid_argument,
      fmt::format("unable to parse view endpoint \"{}\", expected \"_design/<ddoc>/_view/<view>\"",
                  endpoint_));
  }
  design_document_name_ = parts[design_document_index];
  view_name_ = parts[view_index];
}

auto
view_identity::endpoint() const -> const std::string&
{
  return endpoint_;
}

auto
view_identity::design_document_name() const -> const std::string&
{
  return design_document_name_;
}

auto
view_identity::view_name() const -> const std::string&
{
  return view_name_;
}

auto
view_identity::operator==(const view_identity& other) const -> bool
{
  return design_document_name_ == other.design_document_name_ && view_name_ == other.view_name_;
}
} // namespace couchview
