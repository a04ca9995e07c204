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

#include "view_executor.hxx"

#include "core/impl/error.hxx"
#include "core/logger/logger.hxx"
#include "core/operations/view_query_builder.hxx"

#include <couchview/error_codes.hxx>
#include <couchview/fmt/error.hxx>

#include <chrono>
#include <system_error>
#include <variant>

namespace couchview::core
{
namespace
{
constexpr std::chrono::milliseconds default_view_connection_timeout{ 75'000 };
} // namespace

view_executor::view_executor(std::shared_ptr<view_transport> transport,
                             view_identity identity,
                             const view_options& default_options)
  : transport_{ std::move(transport) }
  , identity_{ std::move(identity) }
{
  if (transport_ == nullptr) {
    throw std::system_error(errc::common::invalid_argument,
                            "view \"" + identity_.endpoint() + "\" requires transport");
  }
  default_options_.connection_timeout(default_view_connection_timeout);
  default_options_.merge(default_options);
}

void
view_executor::set_error_handler(view_error_handler handler)
{
  error_handler_ = std::move(handler);
}

auto
view_executor::transport() const -> const std::shared_ptr<view_transport>&
{
  return transport_;
}

auto
view_executor::identity() const -> const view_identity&
{
  return identity_;
}

auto
view_executor::default_options() const -> const view_options&
{
  return default_options_;
}

auto
view_executor::io_context() const -> asio::io_context*
{
  return transport_->io_context();
}

auto
view_executor::submit(const view_options& options)
  -> std::pair<error, std::shared_ptr<view_row_stream>>
{
  auto merged = default_options_;
  merged.merge(options);

  operations::view_query_request request{
    identity_.design_document_name(),
    identity_.view_name(),
    merged.build().params,
  };
  operations::view_wire_query query{};
  if (auto ec = request.encode_to(query); ec) {
    return {
      impl::make_error(ec,
                       "unable to encode view query",
                       tao::json::value{
                         { "design_document_name", identity_.design_document_name() },
                         { "view_name", identity_.view_name() },
                       }),
      nullptr,
    };
  }

  auto [resolve_error, handle] =
    transport_->resolve_view(identity_.design_document_name(), identity_.view_name());
  if (resolve_error) {
    CV_LOG_DEBUG("unable to resolve view \"{}\": {}", identity_.endpoint(), resolve_error);
    return { std::move(resolve_error), nullptr };
  }

  CV_LOG_DEBUG("submit view query: bucket=\"{}\", {} {}",
               handle.bucket_name,
               query.method(),
               query.encoded_target());
  auto [submit_error, stream] = transport_->submit_query(handle, query);
  if (submit_error) {
    CV_LOG_DEBUG("unable to submit query to view \"{}\": {}", identity_.endpoint(), submit_error);
    return { std::move(submit_error), nullptr };
  }
  if (stream == nullptr) {
    return {
      impl::make_error(errc::network::protocol_error,
                       "transport did not return row stream for view \"" + identity_.endpoint() +
                         "\""),
      nullptr,
    };
  }
  return { {}, std::move(stream) };
}

auto
view_executor::handle_stream_error(const view_stream_error& problem) const -> error
{
  CV_LOG_WARNING("view \"{}\" reported error from \"{}\": {}",
                 identity_.endpoint(),
                 problem.from,
                 problem.reason);
  if (error_handler_) {
    error_handler_(problem.from, problem.reason);
    return {};
  }
  return impl::make_view_execution_error(
    identity_.design_document_name(), identity_.view_name(), problem.from, problem.reason);
}

auto
view_executor::stream(const view_options& options, const view_raw_row_handler& handler) -> error
{
  auto [err, stream] = submit(options);
  if (err) {
    return std::move(err);
  }

  error failure{};
  auto stream_error = stream->for_each([this, &handler, &failure](view_stream_item item) {
    if (const auto* problem = std::get_if<view_stream_error>(&item.entry); problem != nullptr) {
      failure = handle_stream_error(*problem);
    } else {
      failure = handler(std::get<raw_view_row>(item.entry), item.last_row);
    }
    return failure ? utils::json::stream_control::stop : utils::json::stream_control::next_row;
  });
  if (stream_error) {
    CV_LOG_DEBUG("view \"{}\" stream failed: {}", identity_.endpoint(), stream_error);
    return stream_error;
  }
  return failure;
}

auto
view_executor::collect(const view_options& options) -> std::pair<error, view_collected_rows>
{
  auto [err, stream] = submit(options);
  if (err) {
    return { std::move(err), {} };
  }

  auto [list_error, result] = stream->to_list();
  if (list_error) {
    CV_LOG_DEBUG("view \"{}\" stream failed: {}", identity_.endpoint(), list_error);
    return { std::move(list_error), {} };
  }

  view_collected_rows collected{};
  collected.total_rows = result.total_rows;
  for (auto& item : result.items) {
    if (const auto* problem = std::get_if<view_stream_error>(&item.entry); problem != nullptr) {
      if (auto failure = handle_stream_error(*problem); failure) {
        return { std::move(failure), {} };
      }
      continue;
    }
    collected.rows.emplace_back(std::move(std::get<raw_view_row>(item.entry)));
  }
  return { {}, std::move(collected) };
}
} // namespace couchview::core
