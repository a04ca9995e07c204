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
#include <utility>
#include <vector>

namespace couchview::core::utils::string_codec
{
/**
 * Encodes the string as application/x-www-form-urlencoded component (space becomes '+').
 */
auto
form_encode(const std::string& src) -> std::string;

/**
 * Renders list of name/value pairs as query string, preserving order of the pairs.
 */
auto
form_encode(const std::vector<std::pair<std::string, std::string>>& values) -> std::string;
} // namespace couchview::core::utils::string_codec
