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

#include "url_codec.hxx"

#include <fmt/core.h>

#include <cctype>
#include <cstdint>

namespace couchview::core::utils::string_codec
{
/* See: https://url.spec.whatwg.org/#urlencoded-serializing: */
/*
 * 0x2A
 * 0x2D
 * 0x2E
 * 0x30 to 0x39
 * 0x41 to 0x5A
 * 0x5F
 * 0x61 to 0x7A
 *  Append a code point whose value is byte to output.
 * Otherwise
 *  Append byte, percent encoded, to output.
 */
template<typename Ti, typename To>
void
form_encode(Ti first, Ti last, To& out)
{
  for (; first != last; ++first) {
    auto c = static_cast<unsigned char>(*first);
    if (isalnum(c) != 0) {
      out.insert(out.end(), first, first + 1);
      continue;
    }
    if (c == ' ') {
      out.push_back('+');
    } else if (c == 0x2A || c == 0x2D || c == 0x2E || c == 0x5F) {
      out.push_back(static_cast<char>(c));
    } else {
      out.append(fmt::format("%{:02X}", static_cast<std::uint8_t>(c)));
    }
  }
}

auto
form_encode(const std::string& src) -> std::string
{
  std::string dst;
  form_encode(src.begin(), src.end(), dst);
  return dst;
}

auto
form_encode(const std::vector<std::pair<std::string, std::string>>& values) -> std::string
{
  std::string dst;
  bool first{ true };
  for (const auto& [name, value] : values) {
    if (first) {
      first = false;
    } else {
      dst.push_back('&');
    }
    form_encode(name.begin(), name.end(), dst);
    dst.push_back('=');
    form_encode(value.begin(), value.end(), dst);
  }
  return dst;
}
} // namespace couchview::core::utils::string_codec
