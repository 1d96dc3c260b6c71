/*
 * Copyright 2018- The Pixie Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-License-Identifier: Apache-2.0
 */


#pragma once

#include <cstdint>

#include "src/common/base/base.h"

DECLARE_bool(fuse);
DECLARE_bool(fuse_io_leaves);
DECLARE_bool(combine_similar);
DECLARE_int64(optimizer_max_iterations);

namespace tessera {
namespace planner {

/**
 * @brief Options that control which rewrite passes the optimizer runs.
 *
 * Rules read their settings from here rather than from the flags, so tests and embedders
 * can configure a planner without touching process state.
 */
struct PlannerOptions {
  // Collapse chains of blockwise expressions into Fused groups.
  bool fuse = true;
  // Let IO leaves be members of fused groups.
  bool fuse_io_leaves = true;
  // Merge reads of the same source that only differ in their columns.
  bool combine_similar = true;
  // Iteration budget of each rule batch and of the simplify loop of one expression.
  int64_t max_iterations = 100;

  // The options given on the command line or through the environment.
  static PlannerOptions FromFlags();
};

}  // namespace planner
}  // namespace tessera
