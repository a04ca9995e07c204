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

#include <couchview/view_result.hxx>

#include "test_helper.hxx"

#include <cstddef>
#include <string>
#include <vector>

TEST_CASE("unit: view result keeps server total separately from rows", "[unit]")
{
  couchview::view_result<std::string> result{ { "post-1", "post-2" }, 42 };
  REQUIRE(result.size() == 2);
  REQUIRE_FALSE(result.empty());
  REQUIRE(result.total_rows() == 42);
  REQUIRE(result.total_entries() == result.total_rows());

  std::vector<std::string> seen{};
  for (const auto& row : result) {
    seen.push_back(row);
  }
  REQUIRE(seen == std::vector<std::string>{ "post-1", "post-2" });

  auto rows = result.take_rows();
  REQUIRE(rows.size() == 2);
  REQUIRE(result.total_rows() == 42);
}

TEST_CASE("unit: view result default is empty", "[unit]")
{
  const couchview::view_result<std::string> result{};
  REQUIRE(result.empty());
  REQUIRE(result.size() == std::size_t{ 0 });
  REQUIRE(result.total_rows() == 0);
  REQUIRE(result.begin() == result.end());
}
