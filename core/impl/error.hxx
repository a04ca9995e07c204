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

#include <couchview/error.hxx>

#include <tao/json/value.hpp>

#include <string>
#include <system_error>

namespace couchview::core::impl
{
auto
make_error(std::error_code ec,
           std::string message = {},
           const tao::json::value& ctx = tao::json::empty_object) -> error;

/**
 * Builds the error reported for an error object found in the view result stream.
 *
 * The message has form "SERVER: <from>: <reason>", and the context carries both values verbatim.
 */
auto
make_view_execution_error(const std::string& design_document_name,
                          const std::string& view_name,
                          const std::string& from,
                          const std::string& reason) -> error;
} // namespace couchview::core::impl
