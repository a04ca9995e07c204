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

#include "utils/mock_view_transport.hxx"

#include <couchview/error_codes.hxx>
#include <couchview/fmt/view.hxx>
#include <couchview/view.hxx>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <fmt/core.h>
#include <tao/json/value.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace
{
constexpr auto three_rows = R"({"total_rows":42,"rows":[
  {"id":"post-1","key":["2012",1],"value":1},
  {"id":"post-2","key":["2012",2],"value":2},
  {"id":"post-3","key":["2012",3],"value":3}
]})";

struct identifier_wrapper {
  static auto wrap(const std::shared_ptr<couchview::core::view_transport>& /* transport */,
                   const couchview::core::raw_view_row& raw) -> std::string
  {
    if (const auto* row = std::get_if<couchview::core::view_row_no_docs>(&raw); row != nullptr) {
      return row->id;
    }
    return "?";
  }
};

auto
ids(const std::vector<couchview::view_row>& rows) -> std::vector<std::string>
{
  std::vector<std::string> result{};
  for (const auto& row : rows) {
    result.push_back(row.id().value_or(""));
  }
  return result;
}
} // namespace

TEST_CASE("unit: view requires well-formed endpoint and transport", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  REQUIRE_THROWS_AS(couchview::view<>(transport, "recent"), std::system_error);
  REQUIRE_THROWS_AS(couchview::view<>(nullptr, "_design/blog/_view/recent"), std::system_error);

  couchview::view<> view{ transport, "_design/blog/_view/recent" };
  REQUIRE(view.design_document_name() == "blog");
  REQUIRE(view.name() == "recent");
  REQUIRE(view.endpoint() == "_design/blog/_view/recent");
}

TEST_CASE("unit: view fetch collects rows with total rows reported by server", "[unit]")
{
  test::utils::init_logger();
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  transport->respond_with(200, three_rows);
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  auto [err, result] = view.fetch();
  REQUIRE_NO_ERROR(err);
  REQUIRE(result.size() == 3);
  REQUIRE(result.total_rows() == 42);
  REQUIRE(result.total_entries() == 42);
  REQUIRE(ids(result.rows()) == std::vector<std::string>{ "post-1", "post-2", "post-3" });
  REQUIRE_FALSE(result.rows()[0].is_last());
  REQUIRE(result.rows()[2].is_last());
  REQUIRE(result.rows()[0].transport() == transport);

  REQUIRE(transport->resolve_calls() == 1);
  REQUIRE(transport->last_handle().design_document_name == "blog");
  REQUIRE(transport->last_handle().view_name == "recent");
}

TEST_CASE("unit: view rows carry identifiers unless reduced", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  transport->respond_with(200, R"({"rows":[
    {"id":"post-1","key":1,"value":1},
    {"id":"post-2","key":2,"value":null,"doc":{"title":"b"}},
    {"key":null,"value":17}
  ]})");
  couchview::view<> view{ transport, "blog/_view/recent" };

  auto [err, result] = view.fetch();
  REQUIRE_NO_ERROR(err);
  REQUIRE(result.size() == 3);
  REQUIRE(result.rows()[0].id() == "post-1");
  REQUIRE(result.rows()[1].id() == "post-2");
  REQUIRE(result.rows()[1].get("title") == tao::json::value("b"));
  REQUIRE_FALSE(result.rows()[2].id().has_value());
  REQUIRE(result.rows()[2].value() == tao::json::value(17));
}

TEST_CASE("unit: view streaming fetch flags only the last row", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  transport->respond_with(200, three_rows);
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  std::vector<couchview::view_row> rows{};
  auto err = view.fetch({}, [&rows](couchview::view_row row) {
    rows.emplace_back(std::move(row));
  });
  REQUIRE_NO_ERROR(err);
  REQUIRE(rows.size() == 3);
  REQUIRE_FALSE(rows[0].is_last());
  REQUIRE_FALSE(rows[1].is_last());
  REQUIRE(rows[2].is_last());

  std::vector<std::string> seen{};
  err = view.each({}, [&seen](couchview::view_row row) {
    seen.push_back(row.id().value_or(""));
  });
  REQUIRE_NO_ERROR(err);
  REQUIRE(seen == ids(rows));
}

TEST_CASE("unit: view streaming fetch requires callable handler", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  auto err = view.fetch({}, couchview::view<>::row_handler{});
  REQUIRE(err.ec() == couchview::errc::common::invalid_argument);
  REQUIRE(transport->resolve_calls() == 0);
}

TEST_CASE("unit: view first and take set limit", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  SECTION("first returns single row")
  {
    transport->respond_with(200,
                            R"({"total_rows":42,"rows":[{"id":"post-1","key":1,"value":1}]})");
    auto [err, row] = view.first(couchview::view_options{}.limit(100).descending(true));
    REQUIRE_NO_ERROR(err);
    REQUIRE(row.has_value());
    REQUIRE(row->id() == "post-1");
    REQUIRE(*transport->last_query().find("limit") == "1");
    REQUIRE(*transport->last_query().find("descending") == "true");

    auto [take_err, taken] = view.take(1);
    REQUIRE_NO_ERROR(take_err);
    REQUIRE(taken.size() == 1);
    REQUIRE(taken.rows().front().id() == row->id());
    REQUIRE(taken.rows().front().key() == row->key());
  }

  SECTION("first returns nothing for empty result")
  {
    transport->respond_with(200, R"({"total_rows":0,"rows":[]})");
    auto [err, row] = view.first();
    REQUIRE_NO_ERROR(err);
    REQUIRE_FALSE(row.has_value());
  }

  SECTION("take returns up to n rows")
  {
    transport->respond_with(200, three_rows);
    auto [err, result] = view.take(5, couchview::view_options{}.skip(2));
    REQUIRE_NO_ERROR(err);
    REQUIRE(result.size() == 3);
    REQUIRE(*transport->last_query().find("limit") == "5");
    REQUIRE(*transport->last_query().find("skip") == "2");
  }
}

TEST_CASE("unit: view merges default options", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::view<> view{
    transport,
    "_design/blog/_view/recent",
    couchview::view_options{}.raw("start_key", "a").limit(10).include_docs(true),
  };

  auto [err, result] = view.fetch(couchview::view_options{}.raw("startkey", "b").limit(20));
  REQUIRE_NO_ERROR(err);

  const auto& query = transport->last_query();
  REQUIRE(*query.find("startkey") == R"("b")");
  REQUIRE(*query.find("limit") == "20");
  REQUIRE(*query.find("include_docs") == "true");
  REQUIRE(*query.find("connection_timeout") == "75000");
  REQUIRE(query.find("start_key") == nullptr);

  couchview::view<> short_timeout{
    transport,
    "_design/blog/_view/recent",
    couchview::view_options{}.connection_timeout(std::chrono::seconds{ 5 }),
  };
  auto [timeout_err, timeout_result] = short_timeout.fetch();
  REQUIRE_NO_ERROR(timeout_err);
  REQUIRE(*transport->last_query().find("connection_timeout") == "5000");
}

TEST_CASE("unit: view sends option values as given", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  auto [err, result] = view.fetch(couchview::view_options{}.raw("limit", "10"));
  REQUIRE_NO_ERROR(err);
  REQUIRE(transport->queries().size() == 1);
  REQUIRE(*transport->last_query().find("limit") == "10");
}

TEST_CASE("unit: view reports malformed body before network call", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  auto [err, result] = view.fetch(couchview::view_options{}.raw("body", "limit=1"));
  REQUIRE(err.ec() == couchview::errc::common::invalid_argument);
  REQUIRE(err.ctx().get_string("view_name") == "recent");
  REQUIRE(transport->resolve_calls() == 0);
  REQUIRE(transport->queries().empty());
}

TEST_CASE("unit: view embedded error without observer", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  transport->respond_with(200, R"({"total_rows":2,"rows":[{"id":"post-1","key":1,"value":1}],
    "errors":[{"from":"10.0.0.2:8092","reason":"shutdown"}]})");
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  SECTION("eager")
  {
    auto [err, result] = view.fetch();
    REQUIRE(err.ec() == couchview::errc::view::view_execution_failure);
    REQUIRE(err.message() == "SERVER: 10.0.0.2:8092: shutdown");
    REQUIRE(err.ctx().get_string("from") == "10.0.0.2:8092");
    REQUIRE(err.ctx().get_string("reason") == "shutdown");
    REQUIRE(result.empty());
  }

  SECTION("streaming keeps rows delivered before the error")
  {
    std::vector<couchview::view_row> rows{};
    auto err = view.fetch({}, [&rows](couchview::view_row row) {
      rows.emplace_back(std::move(row));
    });
    REQUIRE(err.ec() == couchview::errc::view::view_execution_failure);
    REQUIRE(err.ctx().get_string("from") == "10.0.0.2:8092");
    REQUIRE(rows.size() == 1);
  }
}

TEST_CASE("unit: view embedded error with observer", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  transport->respond_with(200, R"({"total_rows":2,"rows":[{"id":"post-1","key":1,"value":1}],
    "errors":[{"from":"10.0.0.2:8092","reason":"shutdown"}]})");
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  std::vector<std::pair<std::string, std::string>> reported{};
  auto& chained = view.on_error([&reported](const std::string& from, const std::string& reason) {
    reported.emplace_back(from, reason);
  });
  REQUIRE(&chained == &view);

  auto [err, result] = view.fetch();
  REQUIRE_NO_ERROR(err);
  REQUIRE(result.size() == 1);
  REQUIRE(result.total_rows() == 2);
  REQUIRE(reported.size() == 1);
  REQUIRE(reported[0].first == "10.0.0.2:8092");
  REQUIRE(reported[0].second == "shutdown");
}

TEST_CASE("unit: view observer is invoked for each error in stream order", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::core::view_stream_result items{};
  items.items.push_back(test::utils::make_row("post-1", 1, 1));
  items.items.push_back(test::utils::make_stream_error("node-a", "timeout"));
  items.items.push_back(test::utils::make_row("post-2", 2, 2));
  items.items.back().last_row = true;
  items.items.push_back(test::utils::make_stream_error("node-b", "shutdown"));
  transport->respond_with(items);

  std::vector<std::string> events{};
  couchview::view<> view{ transport, "_design/blog/_view/recent" };
  view.on_error([&events](const std::string& from, const std::string& /* reason */) {
    events.push_back("error:" + from);
  });

  auto err = view.fetch({}, [&events](couchview::view_row row) {
    events.push_back("row:" + row.id().value_or(""));
  });
  REQUIRE_NO_ERROR(err);
  REQUIRE(events ==
          std::vector<std::string>{ "row:post-1", "error:node-a", "row:post-2", "error:node-b" });
}

TEST_CASE("unit: view propagates transport errors", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::view<> view{ transport, "_design/blog/_view/missing" };

  SECTION("HTTP failure")
  {
    transport->respond_with(404, R"({"error":"not_found","reason":"missing_named_view"})");
    auto [err, result] = view.fetch();
    REQUIRE(err.ec() == couchview::errc::view::view_not_found);
    REQUIRE(err.ctx().get_string("reason") == "missing_named_view");
  }

  SECTION("resolve failure")
  {
    transport->fail_resolve_with(couchview::error{ couchview::errc::network::resolve_failure });
    auto [err, result] = view.fetch();
    REQUIRE(err.ec() == couchview::errc::network::resolve_failure);
    REQUIRE(transport->queries().empty());
  }

  SECTION("stream failure after rows")
  {
    couchview::core::view_stream_result items{};
    items.items.push_back(test::utils::make_row("post-1", 1, 1));
    transport->respond_with(items, couchview::error{ couchview::errc::network::end_of_stream });

    std::size_t rows = 0;
    auto err = view.fetch({}, [&rows](couchview::view_row /* row */) {
      ++rows;
    });
    REQUIRE(err.ec() == couchview::errc::network::end_of_stream);
    REQUIRE(rows == 1);
  }
}

TEST_CASE("unit: view propagates decoding failure of reduced value", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::core::view_stream_result items{};
  items.items.push_back(couchview::core::view_stream_item{
    couchview::core::raw_view_row{ couchview::core::view_row_reduced{ "a", "{broken" } } });
  items.items.push_back(test::utils::make_row("post-2", 2, 2));
  transport->respond_with(items);
  couchview::view<> view{ transport, "_design/blog/_view/stats" };

  auto [err, result] = view.fetch();
  REQUIRE(err.ec() == couchview::errc::common::decoding_failure);
  REQUIRE(err.ctx().get_string("view_name") == "stats");

  std::size_t rows = 0;
  auto stream_err = view.fetch({}, [&rows](couchview::view_row /* row */) {
    ++rows;
  });
  REQUIRE(stream_err.ec() == couchview::errc::common::decoding_failure);
  REQUIRE(rows == 0);
  REQUIRE(transport->last_stream()->delivered_items() == 1);
}

TEST_CASE("unit: view fetch_all with synchronous transport", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  transport->respond_with(200, three_rows);
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  SECTION("without handler")
  {
    auto [err, result] = view.fetch_all();
    REQUIRE_NO_ERROR(err);
    REQUIRE(result.size() == 3);
    REQUIRE(result.total_rows() == 42);
  }

  SECTION("with handler")
  {
    std::size_t calls = 0;
    auto err = view.fetch_all(
      {}, [&calls](couchview::error delivered_err, couchview::view<>::result_type result) {
        ++calls;
        REQUIRE_NO_ERROR(delivered_err);
        REQUIRE(result.size() == 3);
        REQUIRE(result.total_rows() == 42);
      });
    REQUIRE_NO_ERROR(err);
    REQUIRE(calls == 1);
  }

  SECTION("with empty handler")
  {
    auto err = view.fetch_all({}, couchview::view<>::fetch_all_handler{});
    REQUIRE(err.ec() == couchview::errc::common::invalid_argument);
    REQUIRE(transport->resolve_calls() == 0);
  }
}

TEST_CASE("unit: view fetch_all with asynchronous transport", "[unit]")
{
  asio::io_context io{};
  auto transport = std::make_shared<test::utils::mock_view_transport>(&io);
  transport->respond_with(200, three_rows);
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  SECTION("handler is required")
  {
    auto [err, result] = view.fetch_all();
    REQUIRE(err.ec() == couchview::errc::common::invalid_argument);
    REQUIRE(transport->resolve_calls() == 0);
  }

  SECTION("delivery is deferred until the event loop runs")
  {
    std::optional<couchview::view<>::result_type> delivered{};
    std::size_t calls = 0;
    auto handler = [&calls, &delivered](couchview::error delivered_err,
                                        couchview::view<>::result_type result) {
      ++calls;
      REQUIRE_NO_ERROR(delivered_err);
      delivered = std::move(result);
    };
    auto err = view.fetch_all({}, handler);
    REQUIRE_NO_ERROR(err);
    REQUIRE(calls == 0);

    io.poll();
    REQUIRE(calls == 1);
    REQUIRE(delivered.has_value());
    REQUIRE(ids(delivered->rows()) == std::vector<std::string>{ "post-1", "post-2", "post-3" });
    REQUIRE(delivered->rows().back().is_last());
  }

  SECTION("empty result is delivered too")
  {
    transport->respond_with(200, R"({"total_rows":0,"rows":[]})");
    std::size_t calls = 0;
    auto err = view.fetch_all(
      {}, [&calls](couchview::error delivered_err, couchview::view<>::result_type result) {
        ++calls;
        REQUIRE_NO_ERROR(delivered_err);
        REQUIRE(result.empty());
      });
    REQUIRE_NO_ERROR(err);
    io.poll();
    REQUIRE(calls == 1);
  }

  SECTION("errors are delivered through the event loop")
  {
    transport->respond_with(200, R"({"total_rows":1,"rows":[{"id":"a","key":1,"value":1}],
      "errors":[{"from":"node-a","reason":"timeout"}]})");
    std::vector<couchview::error> reported{};
    auto err = view.fetch_all(
      {}, [&reported](couchview::error delivered_err, couchview::view<>::result_type result) {
        REQUIRE(result.empty());
        reported.push_back(std::move(delivered_err));
      });
    REQUIRE(err.ec() == couchview::errc::view::view_execution_failure);
    REQUIRE(reported.empty());
    io.poll();
    REQUIRE(reported.size() == 1);
    REQUIRE(reported[0].ec() == couchview::errc::view::view_execution_failure);
  }
}

TEST_CASE("unit: view fetch_all delivers trailing stream error to event loop thread", "[unit]")
{
  asio::io_context io{};
  auto guard = asio::make_work_guard(io);
  std::thread io_thread([&io]() { io.run(); });

  auto transport = std::make_shared<test::utils::mock_view_transport>(&io);
  transport->respond_with(200, R"({"total_rows":3,"rows":[
    {"id":"post-1","key":1,"value":1},
    {"id":"post-2","key":2,"value":2},
    {"id":"post-3","key":3,"value":3}],
    "errors":[{"from":"10.0.0.2:8092","reason":"shutdown"}]})");
  couchview::view<> view{ transport, "_design/blog/_view/recent" };

  std::atomic_int calls{ 0 };
  auto barrier = std::make_shared<std::promise<std::pair<couchview::error, std::size_t>>>();
  auto f = barrier->get_future();
  auto err = view.fetch_all(
    {}, [&calls, barrier](couchview::error delivered_err, couchview::view<>::result_type result) {
      if (++calls == 1) {
        barrier->set_value({ std::move(delivered_err), result.size() });
      }
    });
  REQUIRE(err.ec() == couchview::errc::view::view_execution_failure);

  auto [delivered_err, delivered_rows] = f.get();
  guard.reset();
  io_thread.join();

  REQUIRE(delivered_err.ec() == couchview::errc::view::view_execution_failure);
  REQUIRE(delivered_err.ctx().get_string("from") == "10.0.0.2:8092");
  REQUIRE(delivered_rows == 0);
  REQUIRE(calls == 1);
  REQUIRE(transport->last_stream()->delivered_items() == 4);
}

TEST_CASE("unit: view with custom row wrapper", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  transport->respond_with(200, three_rows);
  couchview::view<identifier_wrapper> view{ transport, "_design/blog/_view/recent" };

  auto [err, result] = view.fetch();
  REQUIRE_NO_ERROR(err);
  REQUIRE(result.rows() == std::vector<std::string>{ "post-1", "post-2", "post-3" });

  auto [first_err, first] = view.first();
  REQUIRE_NO_ERROR(first_err);
  REQUIRE(first == "post-1");
}

TEST_CASE("unit: view rendering", "[unit]")
{
  auto transport = std::make_shared<test::utils::mock_view_transport>();
  couchview::view<> view{
    transport,
    "_design/blog/_view/recent",
    couchview::view_options{}.limit(5),
  };
  REQUIRE(fmt::format("{}", view) == R"(#<view endpoint="_design/blog/_view/recent", )"
                                     R"(options={"connection_timeout":75000,"limit":5}>)");
}
