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

#include "view_response_stream.hxx"

#include "core/impl/error.hxx"
#include "core/logger/logger.hxx"
#include "core/utils/join_strings.hxx"
#include "core/utils/json.hxx"

#include <couchview/error_codes.hxx>

#include <fmt/core.h>
#include <tao/json.hpp>

#include <optional>
#include <vector>

namespace couchview::core::operations
{
namespace
{
auto
member_or_null(const tao::json::value& entry, const std::string& name) -> tao::json::value
{
  if (const auto* member = entry.find(name); member != nullptr) {
    return *member;
  }
  return tao::json::null;
}

auto
parse_bbox(const tao::json::value& entry) -> std::vector<double>
{
  std::vector<double> bbox{};
  if (const auto* box = entry.find("bbox"); box != nullptr && box->is_array()) {
    for (const auto& coordinate : box->get_array()) {
      if (coordinate.is_number()) {
        bbox.emplace_back(coordinate.as<double>());
      }
    }
  }
  return bbox;
}

auto
parse_row(const tao::json::value& entry) -> raw_view_row
{
  const auto* id = entry.find("id");
  const auto* doc = entry.find("doc");
  const bool has_document = doc != nullptr && !doc->is_null();

  if (entry.find("geometry") != nullptr || entry.find("bbox") != nullptr) {
    std::string document_id = (id != nullptr && id->is_string()) ? id->get_string() : std::string{};
    if (has_document) {
      return spatial_view_row_with_docs{
        document_id,          member_or_null(entry, "key"), member_or_null(entry, "value"),
        member_or_null(entry, "geometry"), parse_bbox(entry),          *doc,
      };
    }
    return spatial_view_row_no_docs{
      document_id,
      member_or_null(entry, "key"),
      member_or_null(entry, "value"),
      member_or_null(entry, "geometry"),
      parse_bbox(entry),
    };
  }
  if (id == nullptr) {
    return view_row_reduced{
      member_or_null(entry, "key"),
      utils::json::generate(member_or_null(entry, "value")),
    };
  }
  std::string document_id = id->is_string() ? id->get_string() : utils::json::generate(*id);
  if (has_document) {
    return view_row_with_docs{
      document_id,
      member_or_null(entry, "key"),
      member_or_null(entry, "value"),
      *doc,
    };
  }
  return view_row_no_docs{
    document_id,
    member_or_null(entry, "key"),
    member_or_null(entry, "value"),
  };
}

auto
stringify(const tao::json::value& value) -> std::string
{
  if (value.is_string()) {
    return value.get_string();
  }
  return utils::json::generate(value);
}
} // namespace

buffered_view_row_stream::buffered_view_row_stream(view_stream_result result)
  : result_{ std::move(result) }
{
}

auto
buffered_view_row_stream::parse(std::uint32_t status_code,
                                const std::string& body,
                                const view_handle& handle)
  -> std::pair<error, std::shared_ptr<buffered_view_row_stream>>
{
  if (status_code != 200) {
    return { make_view_http_error(status_code, body, handle), nullptr };
  }

  tao::json::value payload{};
  try {
    payload = utils::json::parse(body);
  } catch (const tao::pegtl::parse_error& e) {
    return {
      impl::make_error(errc::common::parsing_failure,
                       fmt::format("unable to parse view response: {}", e.what()),
                       tao::json::value{
                         { "design_document_name", handle.design_document_name },
                         { "view_name", handle.view_name },
                       }),
      nullptr,
    };
  }
  if (!payload.is_object()) {
    return {
      impl::make_error(errc::common::parsing_failure, "view response is not a JSON object"),
      nullptr,
    };
  }

  view_stream_result result{};
  if (const auto* total_rows = payload.find("total_rows"); total_rows != nullptr) {
    if (total_rows->is_unsigned()) {
      result.total_rows = total_rows->get_unsigned();
    } else if (total_rows->is_signed() && total_rows->get_signed() >= 0) {
      result.total_rows = static_cast<std::uint64_t>(total_rows->get_signed());
    }
  }

  if (const auto* rows = payload.find("rows"); rows != nullptr && rows->is_array()) {
    for (const auto& entry : rows->get_array()) {
      if (!entry.is_object()) {
        CV_LOG_DEBUG("skipping view row which is not an object: {}", utils::json::generate(entry));
        continue;
      }
      result.items.push_back(view_stream_item{ parse_row(entry) });
    }
  }
  if (!result.items.empty()) {
    result.items.back().last_row = true;
  }

  if (const auto* errors = payload.find("errors"); errors != nullptr && errors->is_array()) {
    for (const auto& entry : errors->get_array()) {
      if (!entry.is_object()) {
        continue;
      }
      view_stream_error problem{};
      if (const auto* from = entry.find("from"); from != nullptr) {
        problem.from = stringify(*from);
      }
      if (const auto* reason = entry.find("reason"); reason != nullptr) {
        problem.reason = stringify(*reason);
      }
      result.items.push_back(view_stream_item{ std::move(problem) });
    }
  }

  return { {}, std::make_shared<buffered_view_row_stream>(std::move(result)) };
}

auto
buffered_view_row_stream::to_list() -> std::pair<error, view_stream_result>
{
  return { {}, result_ };
}

auto
buffered_view_row_stream::for_each(const view_stream_handler& handler) -> error
{
  for (const auto& item : result_.items) {
    if (handler(item) == utils::json::stream_control::stop) {
      break;
    }
  }
  return {};
}

auto
make_view_http_error(std::uint32_t status_code, const std::string& body, const view_handle& handle)
  -> error
{
  std::error_code ec{};
  switch (status_code) {
    case 400:
      ec = errc::common::invalid_argument;
      break;
    case 404:
      ec = errc::view::view_not_found;
      break;
    default:
      ec = errc::common::internal_server_failure;
      break;
  }

  std::optional<std::string> type{};
  std::optional<std::string> reason{};
  if (!body.empty()) {
    try {
      if (auto payload = utils::json::parse(body); payload.is_object()) {
        if (const auto* errors = payload.find("errors"); errors != nullptr) {
          type = "invalid_arguments";
          std::vector<std::string> reasons{};
          if (errors->is_object()) {
            for (const auto& [node, node_reason] : errors->get_object()) {
              reasons.emplace_back(stringify(node_reason));
            }
          } else if (errors->is_array()) {
            for (const auto& node_reason : errors->get_array()) {
              reasons.emplace_back(stringify(node_reason));
            }
          }
          reason = utils::join_strings(reasons, " ");
        } else {
          if (const auto* error_type = payload.find("error");
              error_type != nullptr && error_type->is_string()) {
            type = error_type->get_string();
          }
          if (const auto* error_reason = payload.find("reason");
              error_reason != nullptr && error_reason->is_string()) {
            reason = error_reason->get_string();
          }
        }
      }
    } catch (const tao::pegtl::parse_error& e) {
      CV_LOG_DEBUG("unable to parse body of view error response (status: {}): {}",
                   status_code,
                   e.what());
    }
  }

  std::string message = fmt::format("failed to execute view request (status: {})", status_code);
  if (type || reason) {
    std::vector<std::string> details{};
    if (type) {
      details.emplace_back(type.value());
    }
    if (reason) {
      details.emplace_back(reason.value());
    }
    message.insert(message.find(" ("), ": " + utils::join_strings(details, ": "));
  }

  tao::json::value ctx{
    { "design_document_name", handle.design_document_name },
    { "view_name", handle.view_name },
    { "http_status", status_code },
    { "http_body", body },
  };
  if (type) {
    ctx["error_type"] = type.value();
  }
  if (reason) {
    ctx["reason"] = reason.value();
  }
  return impl::make_error(ec, std::move(message), ctx);
}
} // namespace couchview::core::operations
