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


#include "src/planner/rules/planner_state.h"

DEFINE_bool(fuse, gflags::BoolFromEnv("TESSERA_FUSE", true),
            "Collapse chains of blockwise expressions into one task per partition.");
DEFINE_bool(fuse_io_leaves, gflags::BoolFromEnv("TESSERA_FUSE_IO_LEAVES", true),
            "Allow IO leaves to join fused groups.");
DEFINE_bool(combine_similar, gflags::BoolFromEnv("TESSERA_COMBINE_SIMILAR", true),
            "Replace reads of the same source with one read of the column union.");
DEFINE_int64(optimizer_max_iterations,
             gflags::Int64FromEnv("TESSERA_OPTIMIZER_MAX_ITERATIONS", 100),
             "Iteration budget of each optimizer rule batch.");

namespace tessera {
namespace planner {

PlannerOptions PlannerOptions::FromFlags() {
  PlannerOptions options;
  options.fuse = FLAGS_fuse;
  options.fuse_io_leaves = FLAGS_fuse_io_leaves;
  options.combine_similar = FLAGS_combine_similar;
  options.max_iterations = FLAGS_optimizer_max_iterations;
  return options;
}

}  // namespace planner
}  // namespace tessera
