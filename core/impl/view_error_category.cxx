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

#include <couchview/error_codes.hxx>

#include <string>

namespace couchview::core::impl
{
struct view_error_category : std::error_category {
  [[nodiscard]] const char* name() const noexcept override
  {
    return "couchview.view";
  }

  [[nodiscard]] std::string message(int ev) const noexcept override
  {
    switch (static_cast<errc::view>(ev)) {
      case errc::view::view_not_found:
        return "view_not_found (501)";
      case errc::view::view_execution_failure:
        return "view_execution_failure (503)";
    }
    return "FIXME: unknown error code (recompile with newer library): couchview.view." +
           std::to_string(ev);
  }
};

const inline static view_error_category view_category_instance;

const std::error_category&
view_category() noexcept
{
  return view_category_instance;
}

} // namespace couchview::core::impl
