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
 * Staleness tolerance of the view query.
 *
 * @since 1.0.0
 * @committed
 */
enum class view_scan_consistency {
  /**
   * Allow stale views (`stale=ok`).
   *
   * @since 1.0.0
   * @committed
   */
  not_bounded,

  /**
   * Allow stale view, update view after it has been accessed (`stale=update_after`). This is the
   * default used by the server.
   *
   * @since 1.0.0
   * @committed
   */
  update_after,

  /**
   * Force a view update before returning data (`stale=false`).
   *
   * @since 1.0.0
   * @committed
   */
  request_plus,
};
} // namespace couchview
