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

#include "test_helper.hxx"

#include "core/impl/error.hxx"

#include <couchview/error_codes.hxx>
#include <couchview/fmt/error.hxx>

#include <fmt/core.h>
#include <tao/json/value.hpp>

#include <system_error>

TEST_CASE("unit: view error categories", "[unit]")
{
  std::error_code ec = couchview::errc::view::view_execution_failure;
  REQUIRE(std::string(ec.category().name()) == "couchview.view");
  REQUIRE(ec.message() == "view_execution_failure (503)");

  ec = couchview::errc::common::decoding_failure;
  REQUIRE(std::string(ec.category().name()) == "couchview.common");
  REQUIRE(ec.message() == "decoding_failure (20)");

  ec = couchview::errc::network::resolve_failure;
  REQUIRE(std::string(ec.category().name()) == "couchview.network");
  REQUIRE(ec.message() == "resolve_failure (1001)");
}

TEST_CASE("unit: view execution error", "[unit]")
{
  auto err = couchview::core::impl::make_view_execution_error(
    "blog", "recent", "10.0.0.2:8092", "timeout");
  REQUIRE(err.ec() == couchview::errc::view::view_execution_failure);
  REQUIRE(err.message() == "SERVER: 10.0.0.2:8092: timeout");
  REQUIRE(err.ctx().get_string("design_document_name") == "blog");
  REQUIRE(err.ctx().get_string("view_name") == "recent");
  REQUIRE(err.ctx().get_string("from") == "10.0.0.2:8092");
  REQUIRE(err.ctx().get_string("reason") == "timeout");
}

TEST_CASE("unit: error rendering", "[unit]")
{
  SECTION("code only")
  {
    couchview::error err{ couchview::errc::common::invalid_argument };
    REQUIRE_FALSE(err.ctx());
    REQUIRE(fmt::format("{}", err) == "invalid_argument (3)");
  }

  SECTION("message and context")
  {
    auto err = couchview::core::impl::make_error(
      couchview::errc::view::view_not_found, "missing", tao::json::value{ { "view_name", "a" } });
    REQUIRE(fmt::format("{}", err) == R"(view_not_found (501) - missing | {"view_name":"a"})");
  }

  SECTION("cause")
  {
    couchview::error err{ couchview::errc::common::parsing_failure,
                          "bad body",
                          {},
                          couchview::error{ couchview::errc::network::end_of_stream } };
    REQUIRE(err.cause().has_value());
    REQUIRE(fmt::format("{}", err) ==
            "parsing_failure (8) - bad body (cause: end_of_stream (1007))");
  }
}
