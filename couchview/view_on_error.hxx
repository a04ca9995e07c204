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

namespace couchview
{
/**
 * Sets the response of the server in the event of an error on one of the nodes.
 *
 * @since 1.0.0
 * @committed
 */
enum class view_on_error {
  /**
   * Continue to generate view information in the event of an error, including the error
   * information in the view response stream (`on_error=continue`).
   */
  resume,

  /**
   * Stop immediately when an error condition occurs. No further view information will be
   * returned (`on_error=stop`).
   */
  stop,
};
} // namespace couchview
