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

#include <core/impl/error.hxx>
#include <core/view_executor.hxx>
#include <couchview/error.hxx>
#include <couchview/error_codes.hxx>
#include <couchview/view_identity.hxx>
#include <couchview/view_options.hxx>
#include <couchview/view_result.hxx>
#include <couchview/view_row.hxx>
#include <couchview/view_row_wrapper.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace couchview
{
/**
 * Secondary index ("view") of the bucket.
 *
 * The view is identified by the endpoint path, and executes queries through the transport it has
 * been created with. Every fetch merges the options given to the call over the default options of
 * the view.
 *
 * @tparam Wrapper converts raw rows of the stream into values returned to the caller, see
 * @ref default_row_wrapper for the contract
 *
 * @since 1.0.0
 * @committed
 */
template<typename Wrapper = default_row_wrapper>
class view
{
  static_assert(is_row_wrapper_v<Wrapper>,
                "wrapper of the view rows should expose static wrap(transport, raw_row)");

public:
  using row_type = wrapped_row_t<Wrapper>;
  using result_type = view_result<row_type>;
  using row_handler = std::function<void(row_type)>;
  using fetch_all_handler = std::function<void(error, result_type)>;
  using error_handler = std::function<void(const std::string& from, const std::string& reason)>;

  /**
   * @param transport connection that performs I/O for the view
   * @param endpoint path of the view, e.g. `_design/blog/_view/recent`
   * @param default_options options used by every fetch (connection timeout defaults to 75 seconds)
   *
   * @throws std::system_error with errc::common::invalid_argument if the endpoint is malformed or
   * the transport is not set
   *
   * @since 1.0.0
   * @committed
   */
  view(std::shared_ptr<core::view_transport> transport,
       std::string endpoint,
       const view_options& default_options = {})
    : executor_{ std::move(transport), view_identity{ std::move(endpoint) }, default_options }
  {
  }

  /**
   * Registers observer for the errors reported by the server inside of the result (e.g. when one
   * of the nodes is not available). Without observer such error terminates the fetch with
   * errc::view::view_execution_failure.
   *
   * @return the view itself to allow chaining
   *
   * @since 1.0.0
   * @committed
   */
  auto on_error(error_handler handler) -> view&
  {
    executor_.set_error_handler(std::move(handler));
    return *this;
  }

  /**
   * Reads the whole result of the query.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto fetch(const view_options& options = {}) -> std::pair<error, result_type>
  {
    auto [err, collected] = executor_.collect(options);
    if (err) {
      return { std::move(err), {} };
    }
    std::vector<row_type> rows{};
    rows.reserve(collected.rows.size());
    for (const auto& raw : collected.rows) {
      auto [wrap_error, row] = wrap(raw);
      if (wrap_error) {
        return { std::move(wrap_error), {} };
      }
      rows.emplace_back(std::move(row));
    }
    if constexpr (has_mark_last_v<row_type>) {
      if (!rows.empty()) {
        rows.back().mark_last();
      }
    }
    return { {}, result_type{ std::move(rows), collected.total_rows } };
  }

  /**
   * Passes rows to the handler as they arrive, without collecting them. Rows already delivered
   * stay delivered if the stream fails later.
   *
   * @since 1.0.0
   * @committed
   */
  auto fetch(const view_options& options, row_handler handler) -> error
  {
    if (!handler) {
      return core::impl::make_error(errc::common::invalid_argument,
                                    "row handler for the view fetch is not callable");
    }
    return executor_.stream(
      options, [this, &handler](const core::raw_view_row& raw, bool last_row) -> error {
        auto [err, row] = wrap(raw);
        if (err) {
          return std::move(err);
        }
        if constexpr (has_mark_last_v<row_type>) {
          if (last_row) {
            row.mark_last();
          }
        }
        handler(std::move(row));
        return {};
      });
  }

  /**
   * Same as #fetch(const view_options&, row_handler).
   *
   * @since 1.0.0
   * @committed
   */
  auto each(const view_options& options, row_handler handler) -> error
  {
    return fetch(options, std::move(handler));
  }

  /**
   * Returns the first row of the result. Limit of the query is set to one.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto first(view_options options = {}) -> std::pair<error, std::optional<row_type>>
  {
    options.limit(1);
    auto [err, result] = fetch(options);
    if (err) {
      return { std::move(err), {} };
    }
    auto rows = result.take_rows();
    if (rows.empty()) {
      return { {}, std::nullopt };
    }
    return { {}, std::move(rows.front()) };
  }

  /**
   * Returns up to `count` rows of the result. Limit of the query is set to `count`.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto take(std::uint64_t count, view_options options = {})
    -> std::pair<error, result_type>
  {
    options.limit(count);
    return fetch(options);
  }

  /**
   * Reads the whole result of the query. Only allowed for synchronous transports, asynchronous
   * transports require the handler.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto fetch_all(const view_options& options = {}) -> std::pair<error, result_type>
  {
    if (executor_.io_context() != nullptr) {
      return {
        core::impl::make_error(errc::common::invalid_argument,
                               "handler is required for fetch_all in asynchronous mode"),
        {},
      };
    }
    return fetch(options);
  }

  /**
   * Reads the whole result of the query and passes it to the handler.
   *
   * For the synchronous transport the handler is invoked before the function returns. For the
   * asynchronous transport rows are streamed and buffered, and once the stream has been drained
   * the outcome is posted to the event loop of the transport. The handler is invoked exactly once,
   * with the error if the stream failed at any point, including after the last row. In this mode
   * the result does not carry the total number of rows.
   *
   * @return error of the request, which is also passed to the handler
   *
   * @since 1.0.0
   * @committed
   */
  auto fetch_all(const view_options& options, fetch_all_handler handler) -> error
  {
    if (!handler) {
      return core::impl::make_error(errc::common::invalid_argument,
                                    "handler for fetch_all is not callable");
    }

    auto* io = executor_.io_context();
    if (io == nullptr) {
      auto [err, result] = fetch(options);
      handler(err, std::move(result));
      return std::move(err);
    }

    std::vector<row_type> rows{};
    auto err = fetch(options, [&rows](row_type row) {
      rows.emplace_back(std::move(row));
    });
    asio::post(*io, [handler = std::move(handler), err, rows = std::move(rows)]() mutable {
      if (err) {
        handler(err, {});
        return;
      }
      handler({}, result_type{ std::move(rows), 0 });
    });
    return err;
  }

  /**
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto endpoint() const -> const std::string&
  {
    return executor_.identity().endpoint();
  }

  /**
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto design_document_name() const -> const std::string&
  {
    return executor_.identity().design_document_name();
  }

  /**
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto name() const -> const std::string&
  {
    return executor_.identity().view_name();
  }

  /**
   * Options merged into every query of the view.
   *
   * @since 1.0.0
   * @committed
   */
  [[nodiscard]] auto default_options() const -> const view_options&
  {
    return executor_.default_options();
  }

private:
  auto wrap(const core::raw_view_row& raw) const -> std::pair<error, row_type>
  {
    try {
      return { {}, Wrapper::wrap(executor_.transport(), raw) };
    } catch (const std::system_error& e) {
      return {
        core::impl::make_error(e.code(),
                               e.what(),
                               tao::json::value{
                                 { "design_document_name", design_document_name() },
                                 { "view_name", name() },
                               }),
        {},
      };
    }
  }

  core::view_executor executor_;
};
} // namespace couchview
